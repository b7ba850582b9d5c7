// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_COMMON_H
#define JSONEVENT_COMMON_H

#include <cstdint>

namespace jsonevent
{

// Common types.
using Byte = char;
using Size = std::uint64_t;

// Location of the most recently consumed character. `line` counts completed newlines and
// `column` counts characters consumed since the last newline (a newline resets it to 0).
struct Position {
    Size line = 0;
    Size column = 0;
};

inline auto operator==(const Position &lhs, const Position &rhs) -> bool
{
    return lhs.line == rhs.line && lhs.column == rhs.column;
}

inline auto operator!=(const Position &lhs, const Position &rhs) -> bool
{
    return !(lhs == rhs);
}

} // namespace jsonevent

#endif // JSONEVENT_COMMON_H
