// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_SLICE_H
#define JSONEVENT_SLICE_H

#include "common.h"
#include <cassert>
#include <cstring>
#include <string>
#include <string_view>

namespace jsonevent
{

// Non-owning view of a run of characters. Used to pass text into the library without forcing
// a copy (input documents, error messages, XML fragments).
class Slice final
{
public:
    constexpr Slice() = default;

    constexpr Slice(const char *data, size_t size)
        : m_data(data),
          m_size(size)
    {
        assert(m_data);
    }

    Slice(const char *text)
        : Slice(text, std::strlen(text))
    {
    }

    Slice(const std::string &str)
        : m_data(str.data()),
          m_size(str.size())
    {
    }

    constexpr Slice(std::string_view str)
        : m_data(str.data()),
          m_size(str.size())
    {
    }

    [[nodiscard]] constexpr auto is_empty() const -> bool
    {
        return m_size == 0;
    }

    [[nodiscard]] constexpr auto data() const -> const char *
    {
        return m_data;
    }

    [[nodiscard]] constexpr auto size() const -> size_t
    {
        return m_size;
    }

    constexpr auto operator[](size_t index) const -> const char &
    {
        assert(index < m_size);
        return m_data[index];
    }

    [[nodiscard]] auto starts_with(const Slice &prefix) const -> bool
    {
        return prefix.size() <= m_size && to_view().substr(0, prefix.size()) == prefix.to_view();
    }

    [[nodiscard]] auto to_string() const -> std::string
    {
        return {m_data, m_size};
    }

    [[nodiscard]] constexpr auto to_view() const -> std::string_view
    {
        return {m_data, m_size};
    }

private:
    const char *m_data = "";
    size_t m_size = 0;
};

inline auto operator==(const Slice &lhs, const Slice &rhs) -> bool
{
    return lhs.to_view() == rhs.to_view();
}

inline auto operator!=(const Slice &lhs, const Slice &rhs) -> bool
{
    return !(lhs == rhs);
}

} // namespace jsonevent

#endif // JSONEVENT_SLICE_H
