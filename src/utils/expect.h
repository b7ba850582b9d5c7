// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_UTILS_EXPECT_H
#define JSONEVENT_UTILS_EXPECT_H

#include "jsonevent/result.h"
#include <cstdio>
#include <cstdlib>

#ifdef NDEBUG
#define JSONEVENT_EXPECT_(cc, file, line)
#else
#define JSONEVENT_EXPECT_(cc, file, line) jsonevent::impl::handle_expect(cc, #cc, file, line)
#endif // NDEBUG

#define JSONEVENT_EXPECT_TRUE(cc) JSONEVENT_EXPECT_(cc, __FILE__, __LINE__)
#define JSONEVENT_EXPECT_FALSE(cc) JSONEVENT_EXPECT_TRUE(!(cc))
#define JSONEVENT_EXPECT_EQ(t1, t2) JSONEVENT_EXPECT_TRUE((t1) == (t2))
#define JSONEVENT_EXPECT_LE(t1, t2) JSONEVENT_EXPECT_TRUE((t1) <= (t2))

// Return early from a function returning Status if `expr` produced a non-OK Status.
#define JSONEVENT_TRY_S(expr)                                                   \
    do {                                                                        \
        if (auto jsonevent_try_status = (expr); !jsonevent_try_status.is_ok()) { \
            return jsonevent_try_status;                                        \
        }                                                                       \
    } while (0)

// Return early from a function returning Result<T> if `expr` produced an error.
#define JSONEVENT_TRY_R(expr)                                                  \
    do {                                                                       \
        if (auto jsonevent_try_result = (expr); !jsonevent_try_result) {       \
            return tl::make_unexpected(std::move(jsonevent_try_result).error()); \
        }                                                                      \
    } while (0)

namespace jsonevent::impl
{

inline auto handle_expect(bool expectation, const char *repr, const char *file, int line) noexcept -> void
{
    if (!expectation) {
        std::fprintf(stderr, "expectation `%s` failed at %s:%d\n", repr, file, line);
        std::abort();
    }
}

} // namespace jsonevent::impl

#endif // JSONEVENT_UTILS_EXPECT_H
