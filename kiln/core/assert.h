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

#ifdef __cplusplus
extern "C"
{
#endif

void __attribute__((noreturn)) kiln_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#define KILN_LIKELY(x) __builtin_expect(!!(x), 1)

#define KILN_ASSERT(expr)                                                      \
    if (KILN_LIKELY(expr)) { /* likeliest */                                   \
    }                                                                          \
    else {                                                                     \
        kiln_assertion_failed(                                                 \
            #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__);     \
    }

#ifdef NDEBUG
    #define KILN_DEBUG_ASSERT(x)                                               \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define KILN_DEBUG_ASSERT(x) KILN_ASSERT(x)
#endif

#ifdef __cplusplus
}
#endif
