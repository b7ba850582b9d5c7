// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_EXAMPLES_JSON2XML_H
#define JSONEVENT_EXAMPLES_JSON2XML_H

#include "jsonevent/jsonevent.h"
#include <string>

namespace spdlog
{
class logger;
} // namespace spdlog

namespace jsonevent::tools
{

static constexpr auto kExitSuccess = 0;
static constexpr auto kExitRuntimeError = 1;
static constexpr auto kExitUsageError = 2;

struct Arguments {
    XmlOptions xml;
    Options options;

    // "-" means stdin. An empty output means stdout.
    std::string input = "-";
    std::string output;
    bool help = false;
};

auto show_usage() -> void;

// Parse the command line of json2xml. Any problem with the arguments is reported as an
// invalid_argument status.
[[nodiscard]] auto parse_arguments(int argc, const char *argv[]) -> Result<Arguments>;

// Convert the input named by `args` to XML.
[[nodiscard]] auto convert(const Arguments &args, spdlog::logger &log) -> Status;

// Everything main() does. Returns the process exit code.
[[nodiscard]] auto json2xml_main(int argc, const char *argv[]) -> int;

} // namespace jsonevent::tools

#endif // JSONEVENT_EXAMPLES_JSON2XML_H
