// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace docval {

// Reasons a document number can be rejected, each stage of the validation
// pipeline reports exactly one of these.
enum class error_kind : uint8_t {
    wrong_length,
    non_digit_character,
    degenerate_sequence,
    checksum_mismatch,
};

// Stable machine readable code, e.g. "wrong_length"
std::string_view to_string(error_kind kind) noexcept;
// Human readable message, e.g. "invalid length"
std::string_view describe(error_kind kind) noexcept;

class validation_result final {
public:
    constexpr validation_result() noexcept = default;
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    constexpr validation_result(error_kind error) noexcept : error_(error) {}

    static constexpr validation_result valid() noexcept { return {}; }

    [[nodiscard]] constexpr bool ok() const noexcept { return !error_.has_value(); }
    constexpr explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] constexpr error_kind error() const
    {
        if (!error_.has_value()) {
            throw std::logic_error("a valid result has no error");
        }
        return *error_;
    }

    constexpr bool operator==(const validation_result &other) const noexcept = default;

private:
    std::optional<error_kind> error_{std::nullopt};
};

} // namespace docval
