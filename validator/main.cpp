// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "docval.h"
#include "runner.hpp"
#include "utils.hpp"

namespace {

constexpr unsigned max_dir_depth = 4;
constexpr std::string_view document_filename = "document.yaml";

// Directory containing a document.yaml and the samples validated against it
using suite_map = std::map<fs::path, std::vector<fs::path>>;

struct summary {
    unsigned passed{0};
    unsigned xpassed{0};
    unsigned failed{0};
    unsigned xfailed{0};

    [[nodiscard]] bool ok() const { return failed == 0 && xpassed == 0; }
};

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    static constexpr const char *names[] = {"trace", "debug", "info", "warn", "error", "off"};
    printf("[%s][%s:%s:%u]: %s\n", names[level], file, function, line, message);
}

[[noreturn]] void print_help_and_exit(std::string_view name, std::string_view error = {})
{
    std::cerr << "Usage: " << name << " [OPTION]...\n"
              << "    --tests <FILE|DIR>... Space separated list of sample files or directories "
                 "(default: tests/)\n"
              << "    --verbose             Relay library logs at trace level\n"
              << "    --help                Shows this help\n";

    if (!error.empty()) {
        std::cerr << "\nError: " << error << "\n";
        exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
}

bool is_suite(const fs::path &dir) { return is_regular_file(dir / document_filename); }

bool is_sample(const fs::path &path)
{
    return is_regular_file(path) && path.extension() == ".yaml" &&
           path.filename() != document_filename;
}

// NOLINTNEXTLINE(misc-no-recursion)
void collect_suites(const fs::path &dir, suite_map &suites, unsigned level = 0)
{
    if (level == max_dir_depth) {
        return;
    }

    const bool suite = is_suite(dir);
    for (auto const &dir_entry : fs::directory_iterator{dir}) {
        const fs::path &path = dir_entry;
        if (is_directory(path)) {
            collect_suites(path, suites, level + 1);
        } else if (suite && is_sample(path)) {
            suites[dir].push_back(path);
        }
    }
}

void report(const fs::path &file, const test_runner::result &res, summary &sum)
{
    const auto &[passed, expected_fail, error, output] = res;
    std::cout << file.string() << " => ";

    if (passed && !expected_fail) {
        std::cout << term::colour::green << "Passed\n";
        ++sum.passed;
    } else if (passed) {
        std::cout << term::colour::red << "Expected to fail but passed\n";
        ++sum.xpassed;
    } else if (!expected_fail) {
        std::cout << term::colour::red << "Failed: " << error << "\n";
        if (!output.empty()) {
            std::cout << output;
        }
        ++sum.failed;
    } else {
        std::cout << term::colour::yellow << "Failed (expected): " << error << "\n";
        ++sum.xfailed;
    }
    std::cout << term::colour::off;
}

bool run_suite(const fs::path &dir, std::vector<fs::path> &samples)
{
    std::sort(samples.begin(), samples.end());
    std::cout << term::colour::cyan << "Testing: " << dir.string() << term::colour::off << '\n';

    summary sum;
    test_runner runner((dir / document_filename).string());
    for (const auto &sample : samples) { report(sample, runner.run(sample), sum); }

    std::cout << term::colour::blue << "Result: " << term::colour::white << samples.size()
              << " samples" << term::colour::off;
    if (sum.failed > 0) {
        std::cout << ", " << term::colour::red << sum.failed << " failed" << term::colour::off;
    }
    std::cout << ", " << term::colour::green << sum.passed << " passed" << term::colour::off;
    if (sum.xfailed > 0) {
        std::cout << ", " << term::colour::yellow << sum.xfailed << " xfailed"
                  << term::colour::off;
    }
    if (sum.xpassed > 0) {
        std::cout << ", " << term::colour::magenta << sum.xpassed << " xpassed"
                  << term::colour::off;
    }
    std::cout << "\n\n";

    return sum.ok();
}

} // namespace

int main(int argc, char *argv[])
{
    suite_map suites;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--verbose") {
            docval_set_log_cb(log_cb, DOCVAL_LOG_TRACE);
        } else if (arg == "--tests") {
            for (; i + 1 < argc && std::string_view{argv[i + 1]}.substr(0, 2) != "--"; ++i) {
                const fs::path path = argv[i + 1];
                if (is_directory(path)) {
                    collect_suites(path, suites);
                } else if (is_sample(path) && is_suite(path.parent_path())) {
                    suites[path.parent_path()].push_back(path);
                }
            }

            if (suites.empty()) {
                print_help_and_exit(argv[0], "No valid samples provided with --tests");
            }
        } else {
            print_help_and_exit(argv[0]);
        }
    }

    if (suites.empty()) {
        collect_suites(fs::path("tests"), suites);
    }

    int exit_val = EXIT_SUCCESS;
    for (auto &[dir, samples] : suites) {
        try {
            if (!run_suite(dir, samples)) {
                exit_val = EXIT_FAILURE;
            }
        } catch (const std::exception &e) {
            std::cout << term::colour::red << "Invalid suite " << dir.string() << ": " << e.what()
                      << term::colour::off << "\n";
            exit_val = EXIT_FAILURE;
        }
    }

    if (exit_val == EXIT_SUCCESS) {
        std::cout << term::colour::green << "Validation succeeded\n" << term::colour::off;
    } else {
        std::cout << term::colour::red << "Validation failed\n" << term::colour::off;
    }
    return exit_val;
}
