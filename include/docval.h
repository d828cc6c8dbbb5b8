// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef DOCVAL_H
#define DOCVAL_H

#ifdef __cplusplus
#include <cstddef>

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum DOCVAL_RET_CODE
 *
 * Codes returned by the validation functions. Negative values are errors in the
 * call itself, positive values are the reason a document number was rejected.
 **/
typedef enum
{
    DOCVAL_ERR_INTERNAL                = -2,
    DOCVAL_ERR_INVALID_ARGUMENT        = -1,
    DOCVAL_OK                          = 0,
    // Not the expected number of digits once formatting is removed
    DOCVAL_ERR_WRONG_LENGTH            = 1,
    // A character which is neither a digit nor accepted formatting
    DOCVAL_ERR_NON_DIGIT_CHARACTER     = 2,
    // Every digit is identical, e.g. 111.111.111-11
    DOCVAL_ERR_DEGENERATE_SEQUENCE     = 3,
    // The check digits don't match the payload
    DOCVAL_ERR_CHECKSUM_MISMATCH       = 4,
} DOCVAL_RET_CODE;

/**
 * @enum DOCVAL_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    DOCVAL_LOG_TRACE,
    DOCVAL_LOG_DEBUG,
    DOCVAL_LOG_INFO,
    DOCVAL_LOG_WARN,
    DOCVAL_LOG_ERROR,
    DOCVAL_LOG_OFF,
} DOCVAL_LOG_LEVEL;

/**
 * @typedef docval_log_cb
 *
 * Callback that docval will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*docval_log_cb)(
    DOCVAL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * docval_cpf_validate
 *
 * Validates a Brazilian individual taxpayer number (CPF). Dots, dashes and
 * whitespace are accepted as formatting, e.g. "123.456.789-09".
 *
 * @param value The candidate number, it doesn't need to be NUL-terminated. (nonnull)
 * @param length The length of the value.
 *
 * @return DOCVAL_OK if the number is valid, otherwise the reason it was rejected
 *         or DOCVAL_ERR_INVALID_ARGUMENT if value is NULL.
 **/
DOCVAL_RET_CODE docval_cpf_validate(const char *value, size_t length);

/**
 * docval_cnpj_validate
 *
 * Validates a Brazilian legal entity taxpayer number (CNPJ). Dots, dashes,
 * slashes and whitespace are accepted as formatting, e.g. "12.345.678/0001-95".
 *
 * @param value The candidate number, it doesn't need to be NUL-terminated. (nonnull)
 * @param length The length of the value.
 *
 * @return DOCVAL_OK if the number is valid, otherwise the reason it was rejected
 *         or DOCVAL_ERR_INVALID_ARGUMENT if value is NULL.
 **/
DOCVAL_RET_CODE docval_cnpj_validate(const char *value, size_t length);

/**
 * docval_tax_id_validate
 *
 * Validates either a CPF or a CNPJ, the document type is selected based on the
 * number of digits in the value (11 for CPF, 14 for CNPJ).
 *
 * @param value The candidate number, it doesn't need to be NUL-terminated. (nonnull)
 * @param length The length of the value.
 *
 * @return DOCVAL_OK if the number is valid, otherwise the reason it was rejected
 *         or DOCVAL_ERR_INVALID_ARGUMENT if value is NULL.
 **/
DOCVAL_RET_CODE docval_tax_id_validate(const char *value, size_t length);

/**
 * docval_cpf_check_digits
 *
 * Computes the two check digits of a CPF payload.
 *
 * @param payload The first 9 digits of the CPF, without formatting. (nonnull)
 * @param length The length of the payload, must be 9.
 * @param output Buffer of at least two characters where the ASCII check
 *               digits are written, no NUL terminator is added. (nonnull)
 *
 * @return DOCVAL_OK on success or DOCVAL_ERR_INVALID_ARGUMENT if the payload
 *         isn't exactly 9 digits.
 **/
DOCVAL_RET_CODE docval_cpf_check_digits(const char *payload, size_t length, char *output);

/**
 * docval_cnpj_check_digits
 *
 * Computes the two check digits of a CNPJ payload.
 *
 * @param payload The first 12 digits of the CNPJ, without formatting. (nonnull)
 * @param length The length of the payload, must be 12.
 * @param output Buffer of at least two characters where the ASCII check
 *               digits are written, no NUL terminator is added. (nonnull)
 *
 * @return DOCVAL_OK on success or DOCVAL_ERR_INVALID_ARGUMENT if the payload
 *         isn't exactly 12 digits.
 **/
DOCVAL_RET_CODE docval_cnpj_check_digits(const char *payload, size_t length, char *output);

/**
 * docval_ret_code_to_string
 *
 * Provides a human readable description of a return code.
 *
 * @param code The code to describe.
 *
 * @return Static string, note that this should not be freed
 **/
const char *docval_ret_code_to_string(DOCVAL_RET_CODE code);

/**
 * docval_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *docval_get_version();

/**
 * docval_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool docval_set_log_cb(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*DOCVAL_H */
