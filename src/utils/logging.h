// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_UTILS_LOGGING_H
#define JSONEVENT_UTILS_LOGGING_H

#include "jsonevent/slice.h"
#include <string>

namespace jsonevent
{

// Printable ASCII is copied as-is. Everything else is written as "\xNN".
auto append_escaped_string(std::string &out, const Slice &value) -> void;
auto escape_string(const Slice &value) -> std::string;

} // namespace jsonevent

#endif // JSONEVENT_UTILS_LOGGING_H
