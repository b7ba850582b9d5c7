// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_BENCHMARKS_BENCHMARK_H
#define JSONEVENT_BENCHMARKS_BENCHMARK_H

#include <cstdint>
#include <random>
#include <string>

namespace jsonevent::benchmarks
{

// Build a JSON document that holds `num_records` objects, each with a mix of value types. The
// same arguments always produce the same document.
inline auto make_document(std::size_t num_records, bool pretty) -> std::string
{
    std::default_random_engine rng(42);
    std::uniform_int_distribution<std::uint32_t> dist(0, 1'000'000);
    const auto *nl = pretty ? "\n" : "";
    const auto *indent = pretty ? "    " : "";

    std::string out = "[";
    out += nl;
    for (std::size_t i = 0; i < num_records; ++i) {
        const auto n = dist(rng);
        out += indent;
        out += R"({"id":)" + std::to_string(i);
        out += R"(,"name":"record \")" + std::to_string(n) + R"(\" \u00e9\t")";
        out += R"(,"score":)" + std::to_string(n % 1'000) + '.' + std::to_string(n % 97) + "e-" + std::to_string(n % 9);
        out += R"(,"active":)";
        out += n % 2 ? "true" : "false";
        out += R"(,"parent":null,"tags":["a","b",[)" + std::to_string(n % 10) + "]]}";
        if (i + 1 < num_records) {
            out += ',';
        }
        out += nl;
    }
    out += ']';
    return out;
}

} // namespace jsonevent::benchmarks

#endif // JSONEVENT_BENCHMARKS_BENCHMARK_H
