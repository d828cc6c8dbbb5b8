// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "document/normalizer.hpp"
#include "document/tax_id.hpp"
#include "error_kind.hpp"

namespace docval {

namespace document {

validation_result tax_id::validate(std::string_view input) const
{
    std::string digits;
    auto res = normalize(input, formatting, digits);
    if (!res) {
        return res;
    }

    switch (digits.size()) {
    case cpf::arity:
        return cpf_.validate_digits(digits);
    case cnpj::arity:
        return cnpj_.validate_digits(digits);
    default:
        break;
    }

    return error_kind::wrong_length;
}

} // namespace document

validation_result validate_tax_id(std::string_view input)
{
    return document::tax_id{}.validate(input);
}

} // namespace docval
