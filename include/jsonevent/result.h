// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_RESULT_H
#define JSONEVENT_RESULT_H

#include "status.h"
#include <tl/expected.hpp>

namespace jsonevent
{

template <class T>
using Result = tl::expected<T, Status>;
using Err = tl::unexpected<Status>;

} // namespace jsonevent

#endif // JSONEVENT_RESULT_H
