// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <vector>

#include "document/base.hpp"

namespace docval::scanner {

// Finds document numbers within arbitrary text: candidates are located with
// the regular expression and only those accepted by the document validator
// are reported.
class document_scanner {
public:
    document_scanner(std::unique_ptr<document::base> &&doc, const std::string &regex_str,
        std::size_t min_length);
    ~document_scanner() = default;
    document_scanner(const document_scanner &) = delete;
    document_scanner(document_scanner &&) noexcept = default;
    document_scanner &operator=(const document_scanner &) = delete;
    document_scanner &operator=(document_scanner &&) noexcept = default;

    [[nodiscard]] std::optional<std::string_view> find_first(std::string_view text) const;
    [[nodiscard]] std::vector<std::string_view> find_all(std::string_view text) const;

    [[nodiscard]] std::string_view name() const { return doc_->name(); }
    [[nodiscard]] std::string_view pattern() const { return regex_->pattern(); }

protected:
    std::unique_ptr<document::base> doc_;
    std::unique_ptr<re2::RE2> regex_{nullptr};
    std::size_t min_length_;
};

document_scanner make_cpf_scanner();
document_scanner make_cnpj_scanner();

} // namespace docval::scanner
