// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "document/normalizer.hpp"
#include "document/structure.hpp"
#include "error_kind.hpp"

namespace docval::document {

class base {
public:
    base() = default;
    virtual ~base() = default;
    base(const base &) = default;
    base(base &&) noexcept = default;
    base &operator=(const base &) = default;
    base &operator=(base &&) noexcept = default;

    // The return value of this function should outlive the function scope,
    // for example, through a constexpr class static string_view initialised
    // with a literal.
    [[nodiscard]] virtual std::string_view name() const = 0;

    // Runs normalization, structural checks and the checksum in that order,
    // the first failure is returned as is.
    [[nodiscard]] virtual validation_result validate(std::string_view input) const = 0;
};

// Validation pipeline shared by all fixed-arity document types. T must provide:
//   - static constexpr std::string_view document_name
//   - static constexpr std::size_t arity
//   - static constexpr std::string_view formatting
//   - const base_checksum &checksum_impl() const noexcept
template <typename T> class base_impl : public base {
public:
    base_impl() = default;
    ~base_impl() override = default;
    base_impl(const base_impl &) = default;
    base_impl(base_impl &&) noexcept = default;
    base_impl &operator=(const base_impl &) = default;
    base_impl &operator=(base_impl &&) noexcept = default;

    [[nodiscard]] std::string_view name() const override { return T::document_name; }

    [[nodiscard]] validation_result validate(std::string_view input) const override
    {
        std::string digits;
        auto res = normalize(input, T::formatting, digits);
        if (!res) {
            return res;
        }
        return validate_digits(digits);
    }

    // Same as validate for input which has already been normalized
    [[nodiscard]] validation_result validate_digits(std::string_view digits) const noexcept
    {
        auto res = check_structure(digits, T::arity);
        if (!res) {
            return res;
        }
        return static_cast<const T *>(this)->checksum_impl().verify(digits);
    }
};

} // namespace docval::document
