// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_UTILS_SYSTEM_H
#define JSONEVENT_UTILS_SYSTEM_H

#include "jsonevent/options.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace jsonevent
{

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

// Owns the sink that every logger created for one parser (or one tool run) writes to.
class System final
{
public:
    explicit System(const Options &options);
    [[nodiscard]] auto create_log(const std::string &name) const -> LogPtr;

private:
    LogSink m_sink;
    spdlog::level::level_enum m_level;
};

// Map out-of-range options onto their defaults.
[[nodiscard]] auto sanitize_options(const Options &options) -> Options;

} // namespace jsonevent

#endif // JSONEVENT_UTILS_SYSTEM_H
