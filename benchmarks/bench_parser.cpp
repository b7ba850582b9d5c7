// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "benchmark.h"
#include "benchmark/benchmark.h"
#include "jsonevent/jsonevent.h"
#include <cstdio>
#include <cstdlib>
#include <sstream>

#define CHECK_OK(expr)                                                 \
    do {                                                               \
        auto check_s = (expr);                                         \
        if (!check_s.is_ok()) {                                        \
            std::fprintf(stderr, "%s\n", check_s.to_string().c_str()); \
            std::abort();                                              \
        }                                                              \
    } while (0)

using namespace jsonevent;
using namespace jsonevent::benchmarks;

enum Layout : int64_t {
    kCompact,
    kPretty,
};

static auto set_label(benchmark::State &state, const std::string &document) -> void
{
    state.SetLabel(state.range(1) == kPretty ? "Pretty" : "Compact");
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(document.size()));
}

static auto lex_document(const std::string &document) -> Status
{
    StringSource source(document);
    Lexer lexer(source);
    Token token;
    for (;;) {
        auto got = lexer.next(token);
        if (!got) {
            return got.error();
        } else if (!*got) {
            return Status::ok();
        }
        benchmark::DoNotOptimize(token);
    }
}

static auto BM_Lex(benchmark::State &state) -> void
{
    const auto document = make_document(static_cast<std::size_t>(state.range(0)), state.range(1) == kPretty);
    for (auto _ : state) {
        CHECK_OK(lex_document(document));
    }
    set_label(state, document);
}
BENCHMARK(BM_Lex)
    ->Args({100, kCompact})
    ->Args({100, kPretty})
    ->Args({10'000, kCompact})
    ->Args({10'000, kPretty});

static auto BM_Parse(benchmark::State &state) -> void
{
    const auto document = make_document(static_cast<std::size_t>(state.range(0)), state.range(1) == kPretty);
    for (auto _ : state) {
        StringSource source(document);
        Size num_events = 0;
        CHECK_OK(for_each_event(source, {}, [&num_events](const auto &) {
            ++num_events;
            return true;
        }));
        benchmark::DoNotOptimize(num_events);
    }
    set_label(state, document);
}
BENCHMARK(BM_Parse)
    ->Args({100, kCompact})
    ->Args({100, kPretty})
    ->Args({10'000, kCompact})
    ->Args({10'000, kPretty});

static auto BM_RenderXml(benchmark::State &state) -> void
{
    const auto document = make_document(static_cast<std::size_t>(state.range(0)), state.range(1) == kPretty);
    XmlOptions xml_options;
    xml_options.formatted = state.range(1) == kPretty;
    for (auto _ : state) {
        StringSource source(document);
        std::ostringstream oss;
        CHECK_OK(render_xml(source, {}, xml_options, oss));
        benchmark::DoNotOptimize(oss);
    }
    set_label(state, document);
}
BENCHMARK(BM_RenderXml)
    ->Args({100, kCompact})
    ->Args({100, kPretty})
    ->Args({10'000, kCompact});

BENCHMARK_MAIN();
