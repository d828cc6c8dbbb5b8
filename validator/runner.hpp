// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <filesystem>
#include <sstream>
#include <string>
#include <tuple>
#include <yaml-cpp/yaml.h>

#include "docval.h"

namespace fs = std::filesystem;

class test_runner {
public:
    using result = std::tuple<bool, bool, std::string, std::string>;
    explicit test_runner(const std::string &document_file);

    test_runner(const test_runner &) = delete;
    test_runner(test_runner &&) = delete;

    test_runner &operator=(const test_runner &) = delete;
    test_runner &operator=(test_runner &&) = delete;

    ~test_runner() = default;

    result run(const fs::path &sample_file);

protected:
    using validate_fn = DOCVAL_RET_CODE (*)(const char *, size_t);
    using check_digits_fn = DOCVAL_RET_CODE (*)(const char *, size_t, char *);

    void run_validations(const YAML::Node &runs);
    void run_check_digits(const YAML::Node &runs);

    std::string document_;
    validate_fn validate_{nullptr};
    // Not every document can derive check digits, e.g. tax_id
    check_digits_fn check_digits_{nullptr};
    std::stringstream output_;
    std::stringstream error_;
};
