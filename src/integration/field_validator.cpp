// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <optional>
#include <string>
#include <string_view>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/tax_id.hpp"
#include "error_kind.hpp"
#include "integration/field_validator.hpp"

namespace docval::integration {

field_error make_field_error(std::string_view document_name, error_kind kind)
{
    return {std::string{to_string(kind)}, std::string{describe(kind)},
        {{"document", std::string{document_name}}}};
}

std::optional<field_error> cpf_field_validator(std::string_view value)
{
    return validate_field<document::cpf>(value);
}

std::optional<field_error> cnpj_field_validator(std::string_view value)
{
    return validate_field<document::cnpj>(value);
}

std::optional<field_error> tax_id_field_validator(std::string_view value)
{
    return validate_field<document::tax_id>(value);
}

} // namespace docval::integration
