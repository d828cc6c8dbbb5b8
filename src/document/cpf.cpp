// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <string_view>

#include "checksum/mod11_checksum.hpp"
#include "document/cpf.hpp"
#include "error_kind.hpp"

namespace docval {

namespace document {

static_assert(cpf::payload_size + mod11_checksum::check_digit_count == cpf::arity);

std::array<uint8_t, mod11_checksum::check_digit_count> cpf::compute_check_digits(
    std::string_view payload)
{
    return mod11_checksum{weights}.compute(payload);
}

} // namespace document

validation_result validate_cpf(std::string_view input) { return document::cpf{}.validate(input); }

} // namespace docval
