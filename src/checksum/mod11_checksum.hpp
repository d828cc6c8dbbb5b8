// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "checksum/base.hpp"

namespace docval {

// Modulo-11 scheme with two trailing check digits, as used by the Receita
// Federal for CPF and CNPJ numbers.
//
// The weight table is the one applied to compute the second check digit, it
// therefore has one element per digit preceding it (arity - 1). The first check
// digit is computed with the same table minus its first element.
class mod11_checksum : public base_checksum {
public:
    static constexpr std::size_t check_digit_count = 2;
    static constexpr uint32_t modulus = 11;

    // The table isn't copied and must outlive the checksum, e.g. a static
    // constexpr array. Throws std::invalid_argument with fewer than 2 weights.
    explicit mod11_checksum(std::span<const uint8_t> weights);
    mod11_checksum(const mod11_checksum &) = default;
    mod11_checksum &operator=(const mod11_checksum &) = default;
    mod11_checksum(mod11_checksum &&) = default;
    mod11_checksum &operator=(mod11_checksum &&) = default;
    ~mod11_checksum() override = default;

    [[nodiscard]] std::size_t arity() const noexcept { return weights_.size() + 1; }
    [[nodiscard]] std::size_t payload_size() const noexcept { return weights_.size() - 1; }

    [[nodiscard]] validation_result verify(std::string_view digits) const noexcept override;

    // Throws std::invalid_argument unless the payload is exactly payload_size()
    // ASCII digits.
    [[nodiscard]] std::array<uint8_t, check_digit_count> compute(std::string_view payload) const;

protected:
    [[nodiscard]] std::array<uint8_t, check_digit_count> derive(
        std::string_view payload) const noexcept;

    std::span<const uint8_t> weights_;
};

} // namespace docval
