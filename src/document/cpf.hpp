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

// Cadastro de Pessoas Físicas, the Brazilian individual taxpayer number:
// 9 payload digits followed by 2 check digits, usually written 123.456.789-09.
class cpf : public base_impl<cpf> {
public:
    static constexpr std::string_view document_name = "cpf";
    static constexpr std::size_t arity = 11;
    static constexpr std::size_t payload_size = 9;
    static constexpr std::string_view formatting = ".-";
    static constexpr std::array<uint8_t, arity - 1> weights{11, 10, 9, 8, 7, 6, 5, 4, 3, 2};

    cpf() = default;
    ~cpf() override = default;
    cpf(const cpf &) = default;
    cpf(cpf &&) noexcept = default;
    cpf &operator=(const cpf &) = default;
    cpf &operator=(cpf &&) noexcept = default;

    // Throws std::invalid_argument unless the payload is exactly 9 ASCII digits
    static std::array<uint8_t, mod11_checksum::check_digit_count> compute_check_digits(
        std::string_view payload);

protected:
    [[nodiscard]] const base_checksum &checksum_impl() const noexcept { return checksum_; }

    mod11_checksum checksum_{weights};

    friend class base_impl<cpf>;
};

} // namespace document

validation_result validate_cpf(std::string_view input);

} // namespace docval
