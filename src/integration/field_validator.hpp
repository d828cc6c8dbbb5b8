// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "document/base.hpp"
#include "error_kind.hpp"

namespace docval::integration {

// Error reported to a field validation framework, a stable code identifying
// the failure, a message suitable for display and a set of named parameters.
struct field_error {
    std::string code;
    std::string message;
    std::map<std::string, std::string> params;

    bool operator==(const field_error &other) const = default;
};

// Custom field validator convention: no error means the field is valid.
using field_validator_fn = std::optional<field_error> (*)(std::string_view value);

field_error make_field_error(std::string_view document_name, error_kind kind);

template <typename Document> std::optional<field_error> validate_field(std::string_view value)
{
    static_assert(std::is_base_of_v<document::base, Document>);

    const Document doc{};
    auto res = doc.validate(value);
    if (res) {
        return std::nullopt;
    }
    return make_field_error(doc.name(), res.error());
}

std::optional<field_error> cpf_field_validator(std::string_view value);
std::optional<field_error> cnpj_field_validator(std::string_view value);
std::optional<field_error> tax_id_field_validator(std::string_view value);

} // namespace docval::integration
