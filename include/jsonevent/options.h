// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_OPTIONS_H
#define JSONEVENT_OPTIONS_H

#include "common.h"
#include <string>

namespace jsonevent
{

static constexpr Size kDefaultMaxDepth = 10'000;
static constexpr auto kDefaultLogFilename = "jsonevent.log";
static constexpr auto kDefaultXmlHeader = R"(<?xml version="1.0" encoding="utf-8"?>)";

enum class LogLevel {
    kTrace,
    kInfo,
    kWarn,
    kError,
    kOff,
};

enum class LogTarget {
    kFile,
    kStdout,
    kStderr,
    kStdoutColor,
    kStderrColor,
};

struct Options {
    LogLevel log_level = LogLevel::kOff;
    LogTarget log_target = LogTarget::kStderr;

    // Only used when log_target is LogTarget::kFile.
    std::string log_path = kDefaultLogFilename;

    // Deepest array/object nesting the parser accepts. 0 means use the default.
    Size max_depth = kDefaultMaxDepth;

    // If true, a high surrogate escape directly followed by a low surrogate escape is
    // decoded as one code point. Otherwise, every \uXXXX escape is appended as its own
    // code unit.
    bool combine_surrogates = false;
};

struct XmlOptions {
    std::string header = kDefaultXmlHeader;
    std::string root_tag = "root";

    // Tag wrapped around each array element.
    std::string list_item = "list_element";

    // Add a type="..." attribute to every scalar element.
    bool typed = false;

    // Put each element on its own line, indented by 4 spaces per level.
    bool formatted = false;
};

} // namespace jsonevent

#endif // JSONEVENT_OPTIONS_H
