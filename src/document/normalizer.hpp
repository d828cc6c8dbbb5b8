// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "error_kind.hpp"

namespace docval::document {

// Strips ASCII whitespace and any character in `formatting` from the raw input,
// the remaining characters are copied into `digits`. Anything other than an
// ASCII digit is rejected with non_digit_character.
validation_result normalize(std::string_view raw, std::string_view formatting, std::string &digits);

} // namespace docval::document
