// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "random.h"
#include <iterator>

namespace jsonevent::test
{

auto DocumentGenerator::generate(Size &event_count) -> std::string
{
    std::string out;
    m_events = 0;
    whitespace(out);
    value(out, 0);
    whitespace(out);
    event_count = m_events;
    return out;
}

auto DocumentGenerator::value(std::string &out, Size depth) -> void
{
    const auto nested_ok = depth < m_param.max_depth;
    switch (m_random->get(nested_ok ? 7U : 5U)) {
        case 0:
            out += m_random->one_in(2) ? "true" : "false";
            ++m_events;
            break;
        case 1:
            out += "null";
            ++m_events;
            break;
        case 2:
        case 3:
            string(out);
            ++m_events;
            break;
        case 4:
        case 5:
            number(out);
            ++m_events;
            break;
        case 6: {
            out += '[';
            const auto width = m_random->get(m_param.max_width);
            for (Size i = 0; i < width; ++i) {
                if (i) {
                    out += ',';
                }
                whitespace(out);
                value(out, depth + 1);
                whitespace(out);
            }
            out += ']';
            m_events += 2;
            break;
        }
        default: {
            out += '{';
            const auto width = m_random->get(m_param.max_width);
            for (Size i = 0; i < width; ++i) {
                if (i) {
                    out += ',';
                }
                whitespace(out);
                string(out);
                whitespace(out);
                out += ':';
                whitespace(out);
                value(out, depth + 1);
                whitespace(out);
                ++m_events;
            }
            out += '}';
            m_events += 2;
        }
    }
}

auto DocumentGenerator::string(std::string &out) -> void
{
    static constexpr const char *kEscapes[] = {
        R"(\")", R"(\\)", R"(\/)", R"(\b)", R"(\f)", R"(\n)", R"(\r)", R"(\t)", R"(\u00e9)", R"(\u0041)"};
    out += '"';
    const auto size = m_random->get(m_param.max_string_size);
    for (Size i = 0; i < size; ++i) {
        if (m_random->one_in(6)) {
            out += kEscapes[m_random->get(std::size(kEscapes) - 1)];
        } else {
            out += static_cast<char>(m_random->get<int>(' ', '~'));
            if (out.back() == '"' || out.back() == '\\') {
                out.back() = '_';
            }
        }
    }
    out += '"';
}

auto DocumentGenerator::number(std::string &out) -> void
{
    if (m_random->one_in(3)) {
        out += '-';
    }
    if (m_random->one_in(4)) {
        out += '0';
    } else {
        out += std::to_string(m_random->get(1U, 999'999U));
    }
    if (m_random->one_in(2)) {
        out += '.' + std::to_string(m_random->get(0U, 9'999U));
    }
    if (m_random->one_in(3)) {
        out += m_random->one_in(2) ? 'e' : 'E';
        if (m_random->one_in(2)) {
            out += m_random->one_in(2) ? '-' : '+';
        }
        out += std::to_string(m_random->get(0U, 300U));
    }
}

auto DocumentGenerator::whitespace(std::string &out) -> void
{
    static constexpr char kSpaces[] = {' ', '\t', '\n', '\r'};
    while (m_random->one_in(3)) {
        out += kSpaces[m_random->get<size_t>(3)];
    }
}

} // namespace jsonevent::test
