// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "json2xml.h"
#include "utils/expect.h"
#include "utils/system.h"
#include <cstdio>
#include <fmt/format.h>
#include <fstream>
#include <iostream>

namespace jsonevent::tools
{

auto show_usage() -> void
{
    fmt::print(stderr, "usage: json2xml [-tfvh] [--header TEXT] [-r TAG] [-l TAG] [-o FILE] [FILE|-]\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, " Parameters\n");
    fmt::print(stderr, "============\n");
    fmt::print(stderr, "  -t, --typed:         Add a type attribute to each value\n");
    fmt::print(stderr, "  -f, --formatted:     Put each element on its own line\n");
    fmt::print(stderr, "  --header TEXT:       First line of the output\n");
    fmt::print(stderr, "  -r, --root TAG:      Name of the root element (default \"root\")\n");
    fmt::print(stderr, "  -l, --list-item TAG: Name of array elements (default \"list_element\")\n");
    fmt::print(stderr, "  -o, --output FILE:   Write to FILE instead of stdout\n");
    fmt::print(stderr, "  -v, --verbose:       Log progress to stderr\n");
    fmt::print(stderr, "  -h, --help:          Show this message\n");
}

auto parse_arguments(int argc, const char *argv[]) -> Result<Arguments>
{
    Arguments args;
    auto has_input = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto take_value = [&]() -> Result<std::string> {
            if (i + 1 >= argc) {
                return Err {Status::invalid_argument(fmt::format("missing value for \"{}\"", arg))};
            }
            return std::string(argv[++i]);
        };

        if (arg == "-t" || arg == "--typed") {
            args.xml.typed = true;
        } else if (arg == "-f" || arg == "--formatted") {
            args.xml.formatted = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.options.log_level = LogLevel::kInfo;
            args.options.log_target = LogTarget::kStderrColor;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "--header" || arg == "-r" || arg == "--root" ||
                   arg == "-l" || arg == "--list-item" || arg == "-o" || arg == "--output") {
            auto value = take_value();
            JSONEVENT_TRY_R(value);
            if (arg == "--header") {
                args.xml.header = *value;
            } else if (arg == "-r" || arg == "--root") {
                args.xml.root_tag = *value;
            } else if (arg == "-l" || arg == "--list-item") {
                args.xml.list_item = *value;
            } else {
                args.output = *value;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Err {Status::invalid_argument(fmt::format("unrecognized option \"{}\"", arg))};
        } else if (has_input) {
            return Err {Status::invalid_argument("expected at most one input file")};
        } else {
            args.input = arg;
            has_input = true;
        }
    }

    if (!is_xml_name(args.xml.root_tag)) {
        return Err {Status::invalid_argument(fmt::format("\"{}\" is not a valid root tag", args.xml.root_tag))};
    }
    if (!is_xml_name(args.xml.list_item)) {
        return Err {Status::invalid_argument(fmt::format("\"{}\" is not a valid list item tag", args.xml.list_item))};
    }
    return args;
}

auto convert(const Arguments &args, spdlog::logger &log) -> Status
{
    std::unique_ptr<Source> source;
    if (args.input == "-") {
        source = std::make_unique<FileSource>(stdin, "<stdin>");
    } else {
        auto opened = new_file_source(args.input);
        if (!opened) {
            return opened.error();
        }
        source = std::move(*opened);
    }

    if (args.output.empty()) {
        return render_xml(*source, args.options, args.xml, std::cout);
    }
    std::ofstream ofs(args.output, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        return Status::system_error(fmt::format("cannot open \"{}\" for writing", args.output));
    }
    JSONEVENT_TRY_S(render_xml(*source, args.options, args.xml, ofs));
    log.info("wrote \"{}\"", args.output);
    return Status::ok();
}

auto json2xml_main(int argc, const char *argv[]) -> int
{
    auto args = parse_arguments(argc, argv);
    if (!args) {
        fmt::print(stderr, "{}\n", args.error().to_string());
        show_usage();
        return kExitUsageError;
    } else if (args->help) {
        show_usage();
        return kExitSuccess;
    }

    const auto log = System(args->options).create_log("json2xml");
    log->info("input: \"{}\", output: \"{}\"", args->input, args->output.empty() ? "-" : args->output);
    log->info("root: <{}>, list item: <{}>, typed: {}, formatted: {}",
              args->xml.root_tag, args->xml.list_item, args->xml.typed, args->xml.formatted);

    const auto s = convert(*args, *log);
    if (!s.is_ok()) {
        fmt::print(stderr, "{}\n", s.to_string());
        return kExitRuntimeError;
    }
    return kExitSuccess;
}

} // namespace jsonevent::tools
