// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include "error_kind.hpp"

namespace docval {

std::string_view to_string(error_kind kind) noexcept
{
    switch (kind) {
    case error_kind::wrong_length:
        return "wrong_length";
    case error_kind::non_digit_character:
        return "non_digit_character";
    case error_kind::degenerate_sequence:
        return "degenerate_sequence";
    case error_kind::checksum_mismatch:
        return "checksum_mismatch";
    }
    return "unknown";
}

std::string_view describe(error_kind kind) noexcept
{
    switch (kind) {
    case error_kind::wrong_length:
        return "invalid length";
    case error_kind::non_digit_character:
        return "non-digit character";
    case error_kind::degenerate_sequence:
        return "all digits are equal";
    case error_kind::checksum_mismatch:
        return "invalid checksum";
    }
    return "unknown error";
}

} // namespace docval
