// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>

#include "checksum/mod11_checksum.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"

#include "common/gtest_utils.hpp"

using namespace docval;

namespace {

TEST(TestMod11Checksum, CpfWeights)
{
    mod11_checksum checksum{document::cpf::weights};
    EXPECT_EQ(checksum.arity(), 11);
    EXPECT_EQ(checksum.payload_size(), 9);

    EXPECT_VALID(checksum.verify("12345678909"));
    EXPECT_VALID(checksum.verify("52998224725"));
    EXPECT_VALID(checksum.verify("11144477735"));

    EXPECT_INVALID(checksum.verify("12345678900"), error_kind::checksum_mismatch);
    EXPECT_INVALID(checksum.verify("12345678919"), error_kind::checksum_mismatch);
    EXPECT_INVALID(checksum.verify("12345678908"), error_kind::checksum_mismatch);
    EXPECT_INVALID(checksum.verify("52998224752"), error_kind::checksum_mismatch);
}

TEST(TestMod11Checksum, CnpjWeights)
{
    mod11_checksum checksum{document::cnpj::weights};
    EXPECT_EQ(checksum.arity(), 14);
    EXPECT_EQ(checksum.payload_size(), 12);

    EXPECT_VALID(checksum.verify("12345678000195"));
    EXPECT_VALID(checksum.verify("11222333000181"));

    EXPECT_INVALID(checksum.verify("12345678000199"), error_kind::checksum_mismatch);
    EXPECT_INVALID(checksum.verify("11222333000118"), error_kind::checksum_mismatch);
}

TEST(TestMod11Checksum, InvalidWeightTable)
{
    static constexpr std::array<uint8_t, 1> single_weight{2};
    static constexpr std::array<uint8_t, 2> two_weights{3, 2};

    EXPECT_THROW(mod11_checksum{std::span<const uint8_t>{}}, std::invalid_argument);
    EXPECT_THROW(mod11_checksum{single_weight}, std::invalid_argument);

    // Smallest usable table: a single payload digit
    mod11_checksum checksum{two_weights};
    EXPECT_EQ(checksum.arity(), 3);
    EXPECT_EQ(checksum.payload_size(), 1);
    EXPECT_EQ(checksum.compute("5"), (std::array<uint8_t, 2>{1, 5}));
    EXPECT_VALID(checksum.verify("515"));
    EXPECT_INVALID(checksum.verify("510"), error_kind::checksum_mismatch);
}

TEST(TestMod11Checksum, RemainderBelowTwoYieldsZero)
{
    mod11_checksum checksum{document::cpf::weights};

    // 123456789: first sum 210, 210 % 11 == 1
    EXPECT_EQ(checksum.compute("123456789"), (std::array<uint8_t, 2>{0, 9}));
    // All zeros, both remainders are 0
    EXPECT_EQ(checksum.compute("000000000"), (std::array<uint8_t, 2>{0, 0}));
}

TEST(TestMod11Checksum, ComputeCheckDigits)
{
    mod11_checksum cpf{document::cpf::weights};
    EXPECT_EQ(cpf.compute("529982247"), (std::array<uint8_t, 2>{2, 5}));
    EXPECT_EQ(cpf.compute("111444777"), (std::array<uint8_t, 2>{3, 5}));

    mod11_checksum cnpj{document::cnpj::weights};
    EXPECT_EQ(cnpj.compute("123456780001"), (std::array<uint8_t, 2>{9, 5}));
    EXPECT_EQ(cnpj.compute("112223330001"), (std::array<uint8_t, 2>{8, 1}));
}

TEST(TestMod11Checksum, ComputeInvalidPayload)
{
    mod11_checksum checksum{document::cpf::weights};

    EXPECT_THROW((void)checksum.compute(""), std::invalid_argument);
    EXPECT_THROW((void)checksum.compute("12345678"), std::invalid_argument);
    EXPECT_THROW((void)checksum.compute("1234567890"), std::invalid_argument);
    EXPECT_THROW((void)checksum.compute("12345678a"), std::invalid_argument);
    EXPECT_THROW((void)checksum.compute("123.456.7"), std::invalid_argument);
}

TEST(TestMod11Checksum, VerifyUnnormalizedInput)
{
    mod11_checksum checksum{document::cpf::weights};

    EXPECT_INVALID(checksum.verify(""), error_kind::wrong_length);
    EXPECT_INVALID(checksum.verify("1234567890"), error_kind::wrong_length);
    EXPECT_INVALID(checksum.verify("123.456.789-09"), error_kind::wrong_length);
    EXPECT_INVALID(checksum.verify("1234567890a"), error_kind::non_digit_character);
    EXPECT_INVALID(checksum.verify("123 5678909"), error_kind::non_digit_character);
}

TEST(TestMod11Checksum, DegenerateSequencesAreNotRejected)
{
    // The checksum alone accepts some repeated sequences, rejecting them is
    // the responsibility of the structural checks.
    mod11_checksum checksum{document::cpf::weights};
    EXPECT_VALID(checksum.verify("00000000000"));
    EXPECT_VALID(checksum.verify("11111111111"));
    EXPECT_VALID(checksum.verify("55555555555"));
}

} // namespace
