// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <cosign/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void cosign_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#ifdef __cplusplus
}
#endif

#define COSIGN_ASSERTION_FAILED_WITH_MSG(expr, msg)                            \
    static_assert(__builtin_constant_p(msg));                                  \
    cosign_assertion_failed(                                                   \
        #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, msg);

/// Assert, with location report upon failure; accepts an optional message,
/// which must be a compile-time-constant string
#define COSIGN_ASSERT(expr, ...)                                               \
    if (COSIGN_LIKELY(expr)) { /* likeliest */                                 \
    }                                                                          \
    else {                                                                     \
        __VA_OPT__(COSIGN_ASSERTION_FAILED_WITH_MSG(expr, __VA_ARGS__);)       \
        __VA_OPT__(__builtin_unreachable();)                                   \
        cosign_assertion_failed(                                               \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            nullptr);                                                          \
    }

/// Abort with a location report; accepts an optional message, which must be
/// a compile-time-constant string
#define COSIGN_ABORT(...)                                                      \
    __VA_OPT__(COSIGN_ASSERTION_FAILED_WITH_MSG(nullptr, __VA_ARGS__);)        \
    __VA_OPT__(__builtin_unreachable();)                                       \
    cosign_assertion_failed(                                                   \
        nullptr,                                                               \
        __extension__ __PRETTY_FUNCTION__,                                     \
        __FILE__,                                                              \
        __LINE__,                                                              \
        nullptr);
