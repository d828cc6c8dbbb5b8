// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "document/structure.hpp"
#include "error_kind.hpp"

namespace docval::document {

bool is_degenerate(std::string_view digits) noexcept
{
    if (digits.empty()) {
        return false;
    }

    return digits.find_first_not_of(digits.front()) == std::string_view::npos;
}

validation_result check_structure(std::string_view digits, std::size_t arity) noexcept
{
    if (digits.size() != arity) {
        return error_kind::wrong_length;
    }

    // Repeated digits are administratively invalid, some of them would
    // otherwise pass the checksum (e.g. 000.000.000-00).
    if (is_degenerate(digits)) {
        return error_kind::degenerate_sequence;
    }

    return {};
}

} // namespace docval::document
