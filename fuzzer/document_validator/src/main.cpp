// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "../common/utils.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/tax_id.hpp"
#include "error_kind.hpp"
#include "scanner/document_scanner.hpp"

using namespace docval_fuzz;

namespace {

// Interleaves dots and whitespace, both accepted by every document type
std::string reformat(std::string_view input)
{
    std::string output;
    output.reserve(input.size() * 2 + 1);
    output.push_back(' ');
    for (std::size_t i = 0; i < input.size(); ++i) {
        output.push_back(input[i]);
        if (i % 3 == 2) {
            output.push_back('.');
        }
    }
    output.push_back('\n');
    return output;
}

template <typename Document> void check_invariants(const Document &doc, std::string_view input)
{
    auto res = doc.validate(input);
    auto reformatted = doc.validate(reformat(input));
    if (res != reformatted) {
        __builtin_trap();
    }
    prevent_optimization(res);
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    static const docval::document::cpf cpf{};
    static const docval::document::cnpj cnpj{};
    static const docval::document::tax_id tax_id{};
    static const auto cpf_scanner = docval::scanner::make_cpf_scanner();
    static const auto cnpj_scanner = docval::scanner::make_cnpj_scanner();

    auto input = bytes_to_string_view(data, size);

    check_invariants(cpf, input);
    check_invariants(cnpj, input);
    check_invariants(tax_id, input);

    // Every reported match must be accepted by the validator on its own
    for (auto match : cpf_scanner.find_all(input)) {
        if (!cpf.validate(match)) {
            __builtin_trap();
        }
    }

    for (auto match : cnpj_scanner.find_all(input)) {
        if (!cnpj.validate(match)) {
            __builtin_trap();
        }
    }

    return 0;
}
