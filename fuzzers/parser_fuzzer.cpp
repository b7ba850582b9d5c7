// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// parser_fuzzer: Fuzz the lexer, parser, and XML renderer using libFuzzer
//
// The fuzzer input is treated as a JSON document. The first byte selects the options and the
// chunk size used to feed the rest of the input to the parser.

#include "fuzzer.h"
#include "jsonevent/jsonevent.h"
#include "utils/fake_source.h"
#include <sstream>
#include <vector>

namespace jsonevent
{

static auto parse_events(Source &source, const Options &options, std::vector<Event> &out) -> Status
{
    return for_each_event(source, options, [&out](const auto &event) {
        out.emplace_back(event);
        return true;
    });
}

// Any document that the parser accepts must be made up of exactly one well-nested value.
static auto check_balanced(const std::vector<Event> &events) -> void
{
    CHECK_FALSE(events.empty());
    Size depth = 0;
    for (size_t i = 0; i < events.size(); ++i) {
        if (i) {
            CHECK_TRUE(depth > 0);
        }
        switch (events[i].kind) {
            case EventKind::kBeginArray:
            case EventKind::kBeginObject:
                ++depth;
                break;
            case EventKind::kEndArray:
            case EventKind::kEndObject:
                CHECK_TRUE(depth > 0);
                --depth;
                break;
            default:
                break;
        }
    }
    CHECK_EQ(depth, 0U);
}

static auto consume_input(const uint8_t *data, size_t size) -> void
{
    if (size == 0) {
        return;
    }
    const auto flags = data[0];
    const std::string text(reinterpret_cast<const char *>(data + 1), size - 1);

    Options options;
    options.combine_surrogates = flags & 1;
    options.max_depth = flags & 2 ? 16 : kDefaultMaxDepth;

    std::vector<Event> events;
    StringSource string_source(text);
    const auto s = parse_events(string_source, options, events);
    if (s.is_ok()) {
        check_balanced(events);
    } else {
        CHECK_TRUE(s.is_lex_error() || s.is_parse_error());
    }

    // Delivering the input in chunks must not change the result.
    std::vector<Event> chunked;
    FakeSource fake_source(text, (flags >> 2) + 1);
    const auto t = parse_events(fake_source, options, chunked);
    CHECK_EQ(s.to_string(), t.to_string());
    CHECK_TRUE(events == chunked);

    XmlOptions xml_options;
    xml_options.typed = flags & 4;
    xml_options.formatted = flags & 8;
    StringSource xml_source(text);
    std::ostringstream oss;
    const auto u = render_xml(xml_source, options, xml_options, oss);
    if (s.is_ok()) {
        CHECK_OK(u);
    } else {
        CHECK_EQ(s.to_string(), u.to_string());
    }
}

} // namespace jsonevent

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    jsonevent::consume_input(data, size);
    return 0;
}
