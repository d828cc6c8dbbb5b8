// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "common/gtest_utils.hpp"
#include "docval.h"

using namespace std::literals;

const char *level_to_str(DOCVAL_LOG_LEVEL level)
{
    switch (level) {
    case DOCVAL_LOG_TRACE:
        return "trace";
    case DOCVAL_LOG_DEBUG:
        return "debug";
    case DOCVAL_LOG_ERROR:
        return "error";
    case DOCVAL_LOG_WARN:
        return "warn";
    case DOCVAL_LOG_INFO:
        return "info";
    case DOCVAL_LOG_OFF:
        break;
    }

    return "off";
}

DOCVAL_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return DOCVAL_LOG_TRACE;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return DOCVAL_LOG_DEBUG;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return DOCVAL_LOG_ERROR;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return DOCVAL_LOG_WARN;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return DOCVAL_LOG_INFO;
    }

    return DOCVAL_LOG_OFF;
}

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    fmt::print("[{}][{}:{}:{}]: {}\n", level_to_str(level), file, function, line, message);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
DOCVAL_LOG_LEVEL find_log_level(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("DOCVAL_TEST_LOG_LEVEL");
    if (env_level != nullptr) {
        return str_to_level(env_level);
    }

    DOCVAL_LOG_LEVEL level = DOCVAL_LOG_OFF;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log_level" || arg == "--log-level") {
            if (i + 1 < argc) {
                level = str_to_level(argv[i + 1]);
            }
            break;
        }
    }
    return level;
}

int main(int argc, char *argv[])
{
    docval_set_log_cb(log_cb, find_log_level(argc, argv));

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
