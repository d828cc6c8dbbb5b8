// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "document/base.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "scanner/document_scanner.hpp"

namespace docval::scanner {

namespace {

constexpr std::string_view cpf_regex = R"(\b\d{3}\.?\d{3}\.?\d{3}-?\d{2}\b)";
constexpr std::string_view cnpj_regex = R"(\b\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}\b)";

} // namespace

document_scanner::document_scanner(
    std::unique_ptr<document::base> &&doc, const std::string &regex_str, std::size_t min_length)
    : doc_(std::move(doc)), min_length_(min_length)
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    if (!doc_) {
        throw std::invalid_argument("invalid document validator");
    }

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);

    regex_ = std::make_unique<re2::RE2>(regex_str, options);
    if (!regex_->ok()) {
        throw std::invalid_argument("invalid regular expression: " + regex_->error_arg());
    }
}

std::optional<std::string_view> document_scanner::find_first(std::string_view text) const
{
    while (text.size() >= min_length_) {
        re2::StringPiece submatch;
        if (!regex_->Match(text, 0, text.size(), re2::RE2::UNANCHORED, &submatch, 1)) {
            break;
        }

        const std::string_view match{submatch.data(), submatch.size()};

        if (doc_->validate(match)) {
            return match;
        }

        text.remove_prefix(match.data() - text.data() + match.size());
    }

    return std::nullopt;
}

std::vector<std::string_view> document_scanner::find_all(std::string_view text) const
{
    std::vector<std::string_view> matches;
    while (true) {
        auto match = find_first(text);
        if (!match.has_value()) {
            break;
        }

        matches.emplace_back(*match);
        text.remove_prefix(match->data() - text.data() + match->size());
    }
    return matches;
}

document_scanner make_cpf_scanner()
{
    return {std::make_unique<document::cpf>(), std::string{cpf_regex}, document::cpf::arity};
}

document_scanner make_cnpj_scanner()
{
    return {std::make_unique<document::cnpj>(), std::string{cnpj_regex}, document::cnpj::arity};
}

} // namespace docval::scanner
