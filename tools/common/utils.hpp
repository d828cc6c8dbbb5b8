// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "docval.h"
#include "error_kind.hpp"

const char *level_to_str(DOCVAL_LOG_LEVEL level);

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

// {"document":..,"input":..,"valid":..,"error":..,"message":..}
std::string verdict_to_json(
    std::string_view document, std::string_view input, const docval::validation_result &res);

// {"document":..,"input":..,"matches":[..]}
std::string matches_to_json(std::string_view document, std::string_view input,
    const std::vector<std::string_view> &matches);
