// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "document/base.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "error_kind.hpp"

namespace docval {
namespace document {

// Brazilian taxpayer number of either kind, the document type is selected by
// the number of digits left after normalization: 11 for a CPF, 14 for a CNPJ.
class tax_id : public base {
public:
    static constexpr std::string_view document_name = "tax_id";
    static constexpr std::string_view formatting = ".-/";

    tax_id() = default;
    ~tax_id() override = default;
    tax_id(const tax_id &) = default;
    tax_id(tax_id &&) noexcept = default;
    tax_id &operator=(const tax_id &) = default;
    tax_id &operator=(tax_id &&) noexcept = default;

    [[nodiscard]] std::string_view name() const override { return document_name; }
    [[nodiscard]] validation_result validate(std::string_view input) const override;

protected:
    cpf cpf_;
    cnpj cnpj_;
};

} // namespace document

validation_result validate_tax_id(std::string_view input);

} // namespace docval
