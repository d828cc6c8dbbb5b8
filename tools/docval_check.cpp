// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/utils.hpp"
#include "docval.h"
#include "document/base.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/tax_id.hpp"
#include "scanner/document_scanner.hpp"

namespace {

struct options {
    std::string document{"tax_id"};
    bool json{false};
    bool scan{false};
    std::vector<std::string> inputs;
};

[[noreturn]] void print_help_and_exit(std::string_view name, std::string_view error = {})
{
    std::cerr << "Usage: " << name << " [OPTION]... [VALUE]...\n"
              << "Validates each VALUE, or each line of standard input when none is given.\n\n"
              << "    --document <cpf|cnpj|tax_id> Document type (default: tax_id)\n"
              << "    --scan                       Report valid document numbers found in "
                 "each input\n"
              << "    --json                       Print one JSON object per input\n"
              << "    --verbose                    Relay library logs at trace level\n"
              << "    --help                       Shows this help\n";

    if (!error.empty()) {
        std::cerr << "\nError: " << error << "\n";
        exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
}

options parse_options(int argc, char *argv[])
{
    options opts;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--document") {
            if (++i == argc) {
                print_help_and_exit(argv[0], "--document requires a value");
            }
            opts.document = argv[i];
        } else if (arg == "--scan") {
            opts.scan = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose") {
            docval_set_log_cb(log_cb, DOCVAL_LOG_TRACE);
        } else if (arg == "--help") {
            print_help_and_exit(argv[0]);
        } else if (arg.substr(0, 2) == "--") {
            print_help_and_exit(argv[0], "unknown option");
        } else {
            opts.inputs.emplace_back(arg);
        }
    }

    if (opts.document != "cpf" && opts.document != "cnpj" && opts.document != "tax_id") {
        print_help_and_exit(argv[0], "unsupported document type");
    }

    if (opts.inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) { opts.inputs.emplace_back(std::move(line)); }
    }

    return opts;
}

std::unique_ptr<docval::document::base> make_validator(std::string_view name)
{
    if (name == "cpf") {
        return std::make_unique<docval::document::cpf>();
    }
    if (name == "cnpj") {
        return std::make_unique<docval::document::cnpj>();
    }
    return std::make_unique<docval::document::tax_id>();
}

std::vector<docval::scanner::document_scanner> make_scanners(std::string_view name)
{
    std::vector<docval::scanner::document_scanner> scanners;
    if (name != "cnpj") {
        scanners.emplace_back(docval::scanner::make_cpf_scanner());
    }
    if (name != "cpf") {
        scanners.emplace_back(docval::scanner::make_cnpj_scanner());
    }
    return scanners;
}

// Returns true if every input is a valid document number
bool validate_inputs(const options &opts)
{
    auto validator = make_validator(opts.document);

    bool all_valid = true;
    for (const auto &input : opts.inputs) {
        auto res = validator->validate(input);
        if (opts.json) {
            std::cout << verdict_to_json(validator->name(), input, res) << '\n';
        } else if (res) {
            std::cout << input << " => valid\n";
        } else {
            std::cout << input << " => invalid (" << docval::describe(res.error()) << ")\n";
        }
        all_valid = all_valid && res.ok();
    }
    return all_valid;
}

// Returns true if at least one document number was found in every input
bool scan_inputs(const options &opts)
{
    auto scanners = make_scanners(opts.document);

    bool all_found = true;
    for (const auto &input : opts.inputs) {
        // (document name, match), ordered by position within the input
        std::vector<std::pair<std::string_view, std::string_view>> found;
        for (const auto &scanner : scanners) {
            for (auto match : scanner.find_all(input)) { found.emplace_back(scanner.name(), match); }
        }
        std::sort(found.begin(), found.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.second.data() < rhs.second.data(); });

        if (opts.json) {
            std::vector<std::string_view> matches;
            matches.reserve(found.size());
            for (const auto &entry : found) { matches.emplace_back(entry.second); }
            std::cout << matches_to_json(opts.document, input, matches) << '\n';
        } else {
            for (const auto &[name, match] : found) { std::cout << name << ": " << match << '\n'; }
        }

        all_found = all_found && !found.empty();
    }
    return all_found;
}

} // namespace

int main(int argc, char *argv[])
{
    try {
        auto opts = parse_options(argc, argv);
        const bool res = opts.scan ? scan_inputs(opts) : validate_inputs(opts);
        return res ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << "Unexpected exception: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
