// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstring>
#include <string_view>

#include "utils.hpp"
#include "version.hpp"

#include "common/gtest_utils.hpp"

namespace {

TEST(TestValidateInterface, Cpf)
{
    EXPECT_EQ(docval_cpf_validate(STRL("123.456.789-09")), DOCVAL_OK);
    EXPECT_EQ(docval_cpf_validate(STRL("12345678909")), DOCVAL_OK);
    EXPECT_EQ(docval_cpf_validate(STRL(" 529.982.247-25 ")), DOCVAL_OK);
    EXPECT_EQ(docval_cpf_validate(STRL("123.456.789-00")), DOCVAL_ERR_CHECKSUM_MISMATCH);
    EXPECT_EQ(docval_cpf_validate(STRL("111.111.111-11")), DOCVAL_ERR_DEGENERATE_SEQUENCE);
    EXPECT_EQ(docval_cpf_validate(STRL("123.456.789")), DOCVAL_ERR_WRONG_LENGTH);
    EXPECT_EQ(docval_cpf_validate(STRL("")), DOCVAL_ERR_WRONG_LENGTH);
    EXPECT_EQ(docval_cpf_validate(STRL("123.456.789/09")), DOCVAL_ERR_NON_DIGIT_CHARACTER);
    EXPECT_EQ(docval_cpf_validate(nullptr, 0), DOCVAL_ERR_INVALID_ARGUMENT);
}

TEST(TestValidateInterface, Cnpj)
{
    EXPECT_EQ(docval_cnpj_validate(STRL("12.345.678/0001-95")), DOCVAL_OK);
    EXPECT_EQ(docval_cnpj_validate(STRL("11222333000181")), DOCVAL_OK);
    EXPECT_EQ(docval_cnpj_validate(STRL("12.345.678/0001-99")), DOCVAL_ERR_CHECKSUM_MISMATCH);
    EXPECT_EQ(docval_cnpj_validate(STRL("00.000.000/0000-00")), DOCVAL_ERR_DEGENERATE_SEQUENCE);
    EXPECT_EQ(docval_cnpj_validate(STRL("123.456.789-09")), DOCVAL_ERR_WRONG_LENGTH);
    EXPECT_EQ(docval_cnpj_validate(STRL("12.345.678|0001-95")), DOCVAL_ERR_NON_DIGIT_CHARACTER);
    EXPECT_EQ(docval_cnpj_validate(nullptr, 14), DOCVAL_ERR_INVALID_ARGUMENT);
}

TEST(TestValidateInterface, TaxId)
{
    EXPECT_EQ(docval_tax_id_validate(STRL("123.456.789-09")), DOCVAL_OK);
    EXPECT_EQ(docval_tax_id_validate(STRL("12.345.678/0001-95")), DOCVAL_OK);
    EXPECT_EQ(docval_tax_id_validate(STRL("123.456.789-00")), DOCVAL_ERR_CHECKSUM_MISMATCH);
    EXPECT_EQ(docval_tax_id_validate(STRL("1234567890123")), DOCVAL_ERR_WRONG_LENGTH);
    EXPECT_EQ(docval_tax_id_validate(nullptr, 0), DOCVAL_ERR_INVALID_ARGUMENT);
}

TEST(TestValidateInterface, LengthIsRespected)
{
    // Only the first 11 characters are considered
    const char *value = "12345678909XYZ";
    EXPECT_EQ(docval_cpf_validate(value, 11), DOCVAL_OK);
    EXPECT_EQ(docval_cpf_validate(value, std::strlen(value)), DOCVAL_ERR_NON_DIGIT_CHARACTER);
}

TEST(TestValidateInterface, CheckDigits)
{
    char output[2] = {'x', 'x'};
    EXPECT_EQ(docval_cpf_check_digits(STRL("123456789"), output), DOCVAL_OK);
    EXPECT_STR((std::string_view{output, 2}), "09");

    EXPECT_EQ(docval_cpf_check_digits(STRL("111444777"), output), DOCVAL_OK);
    EXPECT_STR((std::string_view{output, 2}), "35");

    EXPECT_EQ(docval_cnpj_check_digits(STRL("123456780001"), output), DOCVAL_OK);
    EXPECT_STR((std::string_view{output, 2}), "95");

    EXPECT_EQ(docval_cnpj_check_digits(STRL("112223330001"), output), DOCVAL_OK);
    EXPECT_STR((std::string_view{output, 2}), "81");
}

TEST(TestValidateInterface, CheckDigitsInvalidArguments)
{
    char output[2] = {'x', 'x'};
    EXPECT_EQ(docval_cpf_check_digits(STRL("12345678"), output), DOCVAL_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(docval_cpf_check_digits(STRL("12345678X"), output), DOCVAL_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(docval_cpf_check_digits(STRL("123.456.789"), output), DOCVAL_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(docval_cnpj_check_digits(STRL("123456789"), output), DOCVAL_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(docval_cpf_check_digits(nullptr, 9, output), DOCVAL_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(docval_cpf_check_digits(STRL("123456789"), nullptr), DOCVAL_ERR_INVALID_ARGUMENT);

    // Output is untouched on failure
    EXPECT_EQ(output[0], 'x');
    EXPECT_EQ(output[1], 'x');
}

TEST(TestValidateInterface, RetCodeToString)
{
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_OK), "valid");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_WRONG_LENGTH), "invalid length");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_NON_DIGIT_CHARACTER), "non-digit character");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_DEGENERATE_SEQUENCE), "all digits are equal");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_CHECKSUM_MISMATCH), "invalid checksum");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_INVALID_ARGUMENT), "invalid argument");
    EXPECT_STR(docval_ret_code_to_string(DOCVAL_ERR_INTERNAL), "internal error");
}

TEST(TestValidateInterface, Version)
{
    EXPECT_STR(docval_get_version(), docval::current_version);
}

} // namespace
