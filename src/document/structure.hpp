// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "error_kind.hpp"

namespace docval::document {

// True when the sequence is non-empty and every character is the same
bool is_degenerate(std::string_view digits) noexcept;

validation_result check_structure(std::string_view digits, std::size_t arity) noexcept;

} // namespace docval::document
