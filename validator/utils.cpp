// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2025 Datadog, Inc.

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <system_error>
#include <type_traits>
#include <unistd.h>

#include "utils.hpp"

namespace YAML {

DOCVAL_RET_CODE as_if<DOCVAL_RET_CODE, void>::operator()() const
{
    if (node.Type() != NodeType::Scalar) {
        throw parsing_error("Invalid node type, expected scalar code");
    }

    const std::string &code = node.Scalar();
    if (code == "ok") {
        return DOCVAL_OK;
    }
    if (code == "wrong_length") {
        return DOCVAL_ERR_WRONG_LENGTH;
    }
    if (code == "non_digit_character") {
        return DOCVAL_ERR_NON_DIGIT_CHARACTER;
    }
    if (code == "degenerate_sequence") {
        return DOCVAL_ERR_DEGENERATE_SEQUENCE;
    }
    if (code == "checksum_mismatch") {
        return DOCVAL_ERR_CHECKSUM_MISMATCH;
    }
    if (code == "invalid_argument") {
        return DOCVAL_ERR_INVALID_ARGUMENT;
    }

    throw parsing_error("Unknown code: " + code);
}

} // namespace YAML

std::string read_file(std::string_view filename)
{
    std::ifstream file(filename.data(), std::ios::in);
    if (!file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.seekg(0, std::ios::end);
    buffer.resize(file.tellg());
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    file.close();
    return buffer;
}

namespace term {

bool has_colour() { return isatty(fileno(stdout)) != 0; }

} // namespace term

std::ostream &operator<<(std::ostream &os, term::colour c)
{
    // Attempt to verify if ostream is cout
    if (os.rdbuf() != std::cout.rdbuf() || !term::has_colour()) {
        return os;
    }

    os << "\033[" << static_cast<std::underlying_type_t<term::colour>>(c) << "m";
    return os;
}
