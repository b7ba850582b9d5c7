// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_TEST_TOOLS_RANDOM_H
#define JSONEVENT_TEST_TOOLS_RANDOM_H

#include "jsonevent/common.h"
#include <random>
#include <string>
#include <type_traits>

namespace jsonevent::test
{

class Random final
{
public:
    explicit Random(std::uint32_t seed = 0)
        : m_rng(seed)
    {
    }

    template <class T>
    auto get(const T &lower, const T &upper) -> T
    {
        static_assert(std::is_integral_v<T>);
        std::uniform_int_distribution<T> distribution(lower, upper);
        return distribution(m_rng);
    }

    template <class T>
    auto get(const T &upper) -> T
    {
        return get(T {}, upper);
    }

    // Return true with probability 1/n.
    auto one_in(unsigned n) -> bool
    {
        return get(0U, n - 1) == 0;
    }

private:
    std::default_random_engine m_rng;
};

// Generates syntactically valid JSON documents with a mix of every value kind, escapes, and
// arbitrary whitespace between tokens.
class DocumentGenerator final
{
public:
    struct Parameters {
        Size max_depth = 6;
        Size max_width = 5;
        Size max_string_size = 12;
    };

    explicit DocumentGenerator(Random &random)
        : DocumentGenerator(random, Parameters {})
    {
    }

    explicit DocumentGenerator(Random &random, Parameters param)
        : m_param(param),
          m_random(&random)
    {
    }

    // Produce a document. The number of events a parser should report for it is written to
    // `event_count`.
    [[nodiscard]] auto generate(Size &event_count) -> std::string;

private:
    auto value(std::string &out, Size depth) -> void;
    auto string(std::string &out) -> void;
    auto number(std::string &out) -> void;
    auto whitespace(std::string &out) -> void;

    Parameters m_param;
    Random *m_random;
    Size m_events = 0;
};

} // namespace jsonevent::test

#endif // JSONEVENT_TEST_TOOLS_RANDOM_H
