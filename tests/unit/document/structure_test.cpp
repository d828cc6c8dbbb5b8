// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "document/structure.hpp"

#include "common/gtest_utils.hpp"

using namespace docval;
using namespace docval::document;

namespace {

TEST(TestStructure, IsDegenerate)
{
    EXPECT_TRUE(is_degenerate("0"));
    EXPECT_TRUE(is_degenerate("11111111111"));
    EXPECT_TRUE(is_degenerate("99999999999999"));

    EXPECT_FALSE(is_degenerate(""));
    EXPECT_FALSE(is_degenerate("11111111112"));
    EXPECT_FALSE(is_degenerate("21111111111"));
    EXPECT_FALSE(is_degenerate("12345678909"));
}

TEST(TestStructure, WrongLength)
{
    EXPECT_INVALID(check_structure("", 11), error_kind::wrong_length);
    EXPECT_INVALID(check_structure("1234567890", 11), error_kind::wrong_length);
    EXPECT_INVALID(check_structure("123456789090", 11), error_kind::wrong_length);
    EXPECT_INVALID(check_structure("12345678909", 14), error_kind::wrong_length);

    // Length is checked first
    EXPECT_INVALID(check_structure("1111111111", 11), error_kind::wrong_length);
}

TEST(TestStructure, DegenerateSequence)
{
    for (char c = '0'; c <= '9'; ++c) {
        EXPECT_INVALID(check_structure(std::string(11, c), 11), error_kind::degenerate_sequence);
        EXPECT_INVALID(check_structure(std::string(14, c), 14), error_kind::degenerate_sequence);
    }
}

TEST(TestStructure, Valid)
{
    EXPECT_VALID(check_structure("12345678909", 11));
    EXPECT_VALID(check_structure("12345678900", 11));
    EXPECT_VALID(check_structure("12345678000195", 14));
}

} // namespace
