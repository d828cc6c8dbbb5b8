// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "checksum/mod11_checksum.hpp"
#include "document/base.hpp"
#include "error_kind.hpp"

namespace docval {
namespace document {

// Cadastro Nacional da Pessoa Jurídica, the Brazilian legal entity number:
// 8 digits of registration, 4 of branch and 2 check digits, usually written
// 12.345.678/0001-95.
class cnpj : public base_impl<cnpj> {
public:
    static constexpr std::string_view document_name = "cnpj";
    static constexpr std::size_t arity = 14;
    static constexpr std::size_t payload_size = 12;
    static constexpr std::string_view formatting = ".-/";
    static constexpr std::array<uint8_t, arity - 1> weights{
        6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

    cnpj() = default;
    ~cnpj() override = default;
    cnpj(const cnpj &) = default;
    cnpj(cnpj &&) noexcept = default;
    cnpj &operator=(const cnpj &) = default;
    cnpj &operator=(cnpj &&) noexcept = default;

    // Throws std::invalid_argument unless the payload is exactly 12 ASCII digits
    static std::array<uint8_t, mod11_checksum::check_digit_count> compute_check_digits(
        std::string_view payload);

protected:
    [[nodiscard]] const base_checksum &checksum_impl() const noexcept { return checksum_; }

    mod11_checksum checksum_{weights};

    friend class base_impl<cnpj>;
};

} // namespace document

validation_result validate_cnpj(std::string_view input);

} // namespace docval
