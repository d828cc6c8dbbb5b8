// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "docval.h"

#define expect(lhs, rhs) \
    try { \
        assert(lhs, rhs, __LINE__, __func__); \
    } catch (const assert_exception &e) { \
        throw; \
    } catch (const std::exception &e) { \
        throw assert_exception(e.what(), __LINE__, __func__); \
    }

class assert_exception : public std::exception
{
public:
    assert_exception(std::string_view what, int loc, std::string_view fn) {
        std::stringstream ss;
        ss << fn << "(" << loc << "): " << what;
        what_ = ss.str();
    }

    template <typename T>
    assert_exception(const T &lhs, const T &rhs, int loc, std::string_view fn) {
        std::stringstream ss;
        ss << fn << "(" << loc << "): " << lhs << " != " << rhs;
        what_ = ss.str();
    }
    const char* what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

template<typename T>
inline void assert(const T &lhs, const T &rhs, int loc, std::string_view fn)
{
    if (lhs != rhs) { throw assert_exception(lhs, rhs, loc, fn); }
}

inline std::string to_string(bool val) { return val ? "true" : "false"; }

template<>
inline void assert(const bool &lhs, const bool &rhs, int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(to_string(lhs), to_string(rhs), loc, fn);
    }
}

template<>
inline void assert(const DOCVAL_RET_CODE &lhs, const DOCVAL_RET_CODE &rhs,
        int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(std::string{docval_ret_code_to_string(lhs)},
            std::string{docval_ret_code_to_string(rhs)}, loc, fn);
    }
}
