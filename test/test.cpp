// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "test.h"
#include "utils/logging.h"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace jsonevent
{

auto PrintTo(const Slice &s, std::ostream *os) -> void
{
    *os << escape_string(s);
}

auto PrintTo(const Status &s, std::ostream *os) -> void
{
    *os << s.to_string();
}

auto PrintTo(const Token &t, std::ostream *os) -> void
{
    *os << describe(t);
}

auto PrintTo(const Event &e, std::ostream *os) -> void
{
    *os << describe(e);
}

namespace test
{

auto check_status(const char *expr, const Status &s) -> testing::AssertionResult
{
    if (s.is_ok()) {
        return testing::AssertionSuccess();
    } else {
        return testing::AssertionFailure() << expr << ": " << s.to_string();
    }
}

auto lex_all(Source &source, std::vector<Token> &out, const Options &options) -> Status
{
    Lexer lexer(source, options);
    for (;;) {
        Token token;
        auto got = lexer.next(token);
        if (!got) {
            return got.error();
        } else if (!*got) {
            return Status::ok();
        }
        out.emplace_back(std::move(token));
    }
}

auto parse_all(Source &source, std::vector<Event> &out, const Options &options) -> Status
{
    return for_each_event(source, options, [&out](const auto &event) {
        out.emplace_back(event);
        return true;
    });
}

auto lex_all(const Slice &text, std::vector<Token> &out, const Options &options) -> Status
{
    StringSource source(text);
    return lex_all(source, out, options);
}

auto parse_all(const Slice &text, std::vector<Event> &out, const Options &options) -> Status
{
    StringSource source(text);
    return parse_all(source, out, options);
}

// From john's answer to https://stackoverflow.com/questions/11826554
class NullBuffer : public std::streambuf
{
public:
    auto overflow(int c) -> int override
    {
        return c;
    }
} g_null_buffer;

std::ostream g_null_stream(&g_null_buffer);
std::ofstream g_file_stream;

// Write extra messages to this stream during testing.
std::ostream *g_logger = &g_null_stream;

} // namespace test

} // namespace jsonevent

auto main(int argc, char **argv) -> int
{
    using namespace jsonevent::test;
    ::testing::InitGoogleTest(&argc, argv);

    const auto *target = std::getenv("JSONEVENT_TEST_LOG");
    const jsonevent::Slice log_file(target ? target : "");
    if (log_file.starts_with("STDOUT")) {
        g_logger = &std::cout;
    } else if (log_file.starts_with("STDERR")) {
        g_logger = &std::cerr;
    } else if (!log_file.is_empty()) {
        g_file_stream.open(log_file.to_string(), std::ios::app);
        if (g_file_stream.is_open()) {
            g_logger = &g_file_stream;
        }
    }

    TEST_LOG << "Running \"" << argv[0] << "\"...\n";
    const auto rc = RUN_ALL_TESTS();
    TEST_LOG << '[' << (rc ? "FAIL" : "PASS") << "]\n";
    return rc;
}
