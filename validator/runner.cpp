// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2025 Datadog, Inc.

#include <stdexcept>
#include <string>

#include "assert.hpp"
#include "docval.h"
#include "runner.hpp"
#include "utils.hpp"

test_runner::test_runner(const std::string &document_file)
{
    YAML::Node doc = YAML::Load(read_file(document_file));
    document_ = doc["document"].as<std::string>();

    if (document_ == "cpf") {
        validate_ = docval_cpf_validate;
        check_digits_ = docval_cpf_check_digits;
    } else if (document_ == "cnpj") {
        validate_ = docval_cnpj_validate;
        check_digits_ = docval_cnpj_check_digits;
    } else if (document_ == "tax_id") {
        validate_ = docval_tax_id_validate;
    } else {
        throw std::runtime_error("Unknown document type: " + document_);
    }
}

void test_runner::run_validations(const YAML::Node &runs)
{
    expect(true, runs.IsSequence());
    for (auto it = runs.begin(); it != runs.end(); ++it) {
        YAML::Node run = *it;
        auto input = run["input"].as<std::string>();
        auto expected = YAML::as_if<DOCVAL_RET_CODE, void>(run["code"])();

        output_ << document_ << "(\"" << input << "\")\n";

        auto obtained = validate_(input.data(), input.size());
        expect(expected, obtained);
    }
}

void test_runner::run_check_digits(const YAML::Node &runs)
{
    expect(true, runs.IsSequence());
    expect(true, check_digits_ != nullptr);
    for (auto it = runs.begin(); it != runs.end(); ++it) {
        YAML::Node run = *it;
        auto payload = run["payload"].as<std::string>();

        output_ << document_ << " check digits(\"" << payload << "\")\n";

        char digits[2] = {0, 0};
        auto code = check_digits_(payload.data(), payload.size(), digits);

        if (run["digits"].IsDefined()) {
            expect(DOCVAL_OK, code);
            expect(run["digits"].as<std::string>(), std::string(digits, 2));
        } else {
            expect(DOCVAL_ERR_INVALID_ARGUMENT, code);
        }
    }
}

test_runner::result test_runner::run(const fs::path &file)
{
    output_ = {};
    error_ = {};

    bool passed = false;
    bool expected_fail = false;

    try {
        YAML::Node sample = YAML::Load(read_file(file.c_str()));

        if (sample["expected-fail"].IsDefined()) {
            expected_fail = sample["expected-fail"].as<bool>();
        }

        expect(true, sample["runs"].IsDefined() || sample["check_digits"].IsDefined());

        if (sample["runs"].IsDefined()) {
            run_validations(sample["runs"]);
        }

        if (sample["check_digits"].IsDefined()) {
            run_check_digits(sample["check_digits"]);
        }

        passed = true;
    } catch (const std::exception &e) {
        error_ << e.what();
    }

    return {passed, expected_fail, error_.str(), output_.str()};
}
