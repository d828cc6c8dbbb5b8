// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string_view>

#include "docval.h"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/tax_id.hpp"
#include "error_kind.hpp"
#include "log.hpp"
#include "version.hpp"

using namespace docval;

static_assert(static_cast<uint32_t>(log_level::trace) == DOCVAL_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::off) == DOCVAL_LOG_OFF);

namespace {

DOCVAL_RET_CODE to_ret_code(const validation_result &res)
{
    if (res) {
        return DOCVAL_OK;
    }

    switch (res.error()) {
    case error_kind::wrong_length:
        return DOCVAL_ERR_WRONG_LENGTH;
    case error_kind::non_digit_character:
        return DOCVAL_ERR_NON_DIGIT_CHARACTER;
    case error_kind::degenerate_sequence:
        return DOCVAL_ERR_DEGENERATE_SEQUENCE;
    case error_kind::checksum_mismatch:
        return DOCVAL_ERR_CHECKSUM_MISMATCH;
    }

    return DOCVAL_ERR_INTERNAL;
}

template <typename Document> DOCVAL_RET_CODE validate(const char *value, size_t length)
{
    if (value == nullptr) {
        DOCVAL_WARN("Attempting to validate a null {}", Document::document_name);
        return DOCVAL_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = Document{}.validate({value, length});
        if (res) {
            DOCVAL_TRACE("Valid {}", Document::document_name);
        } else {
            DOCVAL_TRACE("Invalid {}: {}", Document::document_name, to_string(res.error()));
        }
        return to_ret_code(res);
    } catch (const std::exception &e) {
        DOCVAL_ERROR("{}", e.what());
    } catch (...) {
        DOCVAL_ERROR("unknown exception");
    }

    return DOCVAL_ERR_INTERNAL;
}

template <typename Document>
DOCVAL_RET_CODE check_digits(const char *payload, size_t length, char *output)
{
    if (payload == nullptr || output == nullptr) {
        DOCVAL_WARN("Attempting to compute {} check digits with a null argument",
            Document::document_name);
        return DOCVAL_ERR_INVALID_ARGUMENT;
    }

    try {
        auto digits = Document::compute_check_digits({payload, length});
        output[0] = static_cast<char>('0' + digits[0]);
        output[1] = static_cast<char>('0' + digits[1]);
        return DOCVAL_OK;
    } catch (const std::invalid_argument &e) {
        DOCVAL_WARN("Invalid {} payload: {}", Document::document_name, e.what());
        return DOCVAL_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        DOCVAL_ERROR("{}", e.what());
    } catch (...) {
        DOCVAL_ERROR("unknown exception");
    }

    return DOCVAL_ERR_INTERNAL;
}

} // namespace

extern "C" {

DOCVAL_RET_CODE docval_cpf_validate(const char *value, size_t length)
{
    return validate<document::cpf>(value, length);
}

DOCVAL_RET_CODE docval_cnpj_validate(const char *value, size_t length)
{
    return validate<document::cnpj>(value, length);
}

DOCVAL_RET_CODE docval_tax_id_validate(const char *value, size_t length)
{
    return validate<document::tax_id>(value, length);
}

DOCVAL_RET_CODE docval_cpf_check_digits(const char *payload, size_t length, char *output)
{
    return check_digits<document::cpf>(payload, length, output);
}

DOCVAL_RET_CODE docval_cnpj_check_digits(const char *payload, size_t length, char *output)
{
    return check_digits<document::cnpj>(payload, length, output);
}

const char *docval_ret_code_to_string(DOCVAL_RET_CODE code)
{
    switch (code) {
    case DOCVAL_ERR_INTERNAL:
        return "internal error";
    case DOCVAL_ERR_INVALID_ARGUMENT:
        return "invalid argument";
    case DOCVAL_OK:
        return "valid";
    case DOCVAL_ERR_WRONG_LENGTH:
        return "invalid length";
    case DOCVAL_ERR_NON_DIGIT_CHARACTER:
        return "non-digit character";
    case DOCVAL_ERR_DEGENERATE_SEQUENCE:
        return "all digits are equal";
    case DOCVAL_ERR_CHECKSUM_MISMATCH:
        return "invalid checksum";
    }
    return "unknown";
}

const char *docval_get_version() { return docval::current_version; }

bool docval_set_log_cb(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    docval::logger::init(cb, level);
    DOCVAL_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}

} // extern "C"
