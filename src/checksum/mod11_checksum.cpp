// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "checksum/mod11_checksum.hpp"
#include "error_kind.hpp"
#include "utils.hpp"

namespace docval {

namespace {

uint32_t weighted_sum(std::string_view digits, std::span<const uint8_t> weights) noexcept
{
    uint32_t sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        sum += static_cast<uint32_t>(digits[i] - '0') * weights[i];
    }
    return sum;
}

uint8_t remainder_to_digit(uint32_t sum) noexcept
{
    const auto remainder = sum % mod11_checksum::modulus;
    return remainder < 2 ? 0 : static_cast<uint8_t>(mod11_checksum::modulus - remainder);
}

} // namespace

mod11_checksum::mod11_checksum(std::span<const uint8_t> weights) : weights_(weights)
{
    if (weights_.size() < check_digit_count) {
        throw std::invalid_argument("a modulo-11 weight table requires at least 2 weights");
    }
}

std::array<uint8_t, mod11_checksum::check_digit_count> mod11_checksum::derive(
    std::string_view payload) const noexcept
{
    const auto first = remainder_to_digit(weighted_sum(payload, weights_.subspan(1)));

    // The second digit covers the payload followed by the derived first digit,
    // which always takes the last weight.
    const auto second = remainder_to_digit(
        weighted_sum(payload, weights_.first(payload.size())) + first * weights_.back());

    return {first, second};
}

validation_result mod11_checksum::verify(std::string_view digits) const noexcept
{
    if (digits.size() != arity()) {
        return error_kind::wrong_length;
    }

    if (!all_digits(digits)) {
        return error_kind::non_digit_character;
    }

    const auto payload = digits.substr(0, payload_size());
    const auto expected = derive(payload);
    for (std::size_t i = 0; i < check_digit_count; ++i) {
        if (static_cast<uint8_t>(digits[payload.size() + i] - '0') != expected[i]) {
            return error_kind::checksum_mismatch;
        }
    }

    return {};
}

std::array<uint8_t, mod11_checksum::check_digit_count> mod11_checksum::compute(
    std::string_view payload) const
{
    if (payload.size() != payload_size()) {
        throw std::invalid_argument("invalid payload length");
    }

    if (!all_digits(payload)) {
        throw std::invalid_argument("payload contains non-digit characters");
    }

    return derive(payload);
}

} // namespace docval
