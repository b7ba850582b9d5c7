// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "system.h"
#include "expect.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace jsonevent
{

static auto to_spdlog_level(LogLevel level) -> spdlog::level::level_enum
{
    switch (level) {
        case LogLevel::kTrace:
            return spdlog::level::trace;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::off;
    }
}

auto sanitize_options(const Options &options) -> Options
{
    auto sanitized = options;
    if (sanitized.max_depth == 0) {
        sanitized.max_depth = kDefaultMaxDepth;
    }
    if (sanitized.log_target == LogTarget::kFile && sanitized.log_path.empty()) {
        sanitized.log_path = kDefaultLogFilename;
    }
    return sanitized;
}

System::System(const Options &options)
    : m_level(to_spdlog_level(options.log_level))
{
    if (m_level == spdlog::level::off) {
        m_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    } else {
        switch (options.log_target) {
            case LogTarget::kStdout:
                m_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
                break;
            case LogTarget::kStderr:
                m_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
                break;
            case LogTarget::kStdoutColor:
                m_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                break;
            case LogTarget::kStderrColor:
                m_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                break;
            default:
                JSONEVENT_EXPECT_FALSE(options.log_path.empty());
                m_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_path);
        }
    }
    m_sink->set_level(m_level);
}

auto System::create_log(const std::string &name) const -> LogPtr
{
    JSONEVENT_EXPECT_FALSE(name.empty());
    auto log = std::make_shared<Log>(name, m_sink);
    log->set_level(m_level);
    return log;
}

} // namespace jsonevent
