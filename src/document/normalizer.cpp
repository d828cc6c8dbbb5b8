// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "document/normalizer.hpp"
#include "error_kind.hpp"
#include "utils.hpp"

namespace docval::document {

validation_result normalize(std::string_view raw, std::string_view formatting, std::string &digits)
{
    digits.clear();
    for (const auto c : raw) {
        if (isdigit(c)) {
            digits.push_back(c);
            continue;
        }

        if (isspace(c) || formatting.find(c) != std::string_view::npos) {
            continue;
        }

        return error_kind::non_digit_character;
    }

    return {};
}

} // namespace docval::document
