// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// events.cpp: Example usage of the jsonevent API.

#include "jsonevent/jsonevent.h"
#include <fmt/format.h>

auto main(int, const char *[]) -> int
{
    namespace je = jsonevent;

    /* lexing */

    {
        // A Source hands characters to the lexer one at a time. StringSource keeps its own copy
        // of the text.
        je::StringSource source(R"({"name": "lilly", "coat": ["tabby", 3, 0.5e1]})");
        je::Lexer lexer(source);

        je::Token token;
        for (;;) {
            auto got = lexer.next(token);
            if (!got) {
                fmt::print(stderr, "{}\n", got.error().to_string());
                return 1;
            } else if (!*got) {
                break;
            }
            fmt::print("token: {}\n", je::describe(token));
        }
    }

    /* parsing */

    {
        // The parser checks the grammar and turns member names into object-key events.
        je::StringSource source(R"({"name": "lilly", "coat": ["tabby", 3, 0.5e1]})");
        je::Options options;
        options.log_level = je::LogLevel::kTrace;
        options.log_target = je::LogTarget::kStderrColor;

        auto s = je::for_each_event(source, options, [](const auto &event) {
            fmt::print("event: {}\n", je::describe(event));
            return true;
        });
        if (!s.is_ok()) {
            fmt::print(stderr, "{}\n", s.to_string());
            return 1;
        }
    }

    /* errors */

    {
        // Errors carry the position at which they were detected.
        je::StringSource source("[3 4]");
        auto s = je::for_each_event(source, {}, [](const auto &) {
            return true;
        });
        fmt::print("{}\n", s.to_string());
    }
    return 0;
}
