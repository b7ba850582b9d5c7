// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "fake_source.h"
#include <algorithm>
#include <fmt/format.h>

namespace jsonevent
{

FakeSource::FakeSource(std::string text, size_t chunk_size)
    : m_text(std::move(text)),
      m_chunk_size(std::max<size_t>(chunk_size, 1))
{
}

auto FakeSource::read(char &out) -> Result<bool>
{
    if (m_offset >= m_fail_after) {
        return Err {Status::system_error(fmt::format("injected read error after {} characters", m_offset))};
    }
    if (m_eof) {
        ++m_reads_after_eof;
        return false;
    }
    if (m_chunk_offset == m_chunk.size()) {
        const auto n = std::min(m_chunk_size, m_text.size() - m_offset);
        if (n == 0) {
            m_eof = true;
            return false;
        }
        m_chunk.assign(m_text.begin() + static_cast<std::ptrdiff_t>(m_offset),
                       m_text.begin() + static_cast<std::ptrdiff_t>(m_offset + n));
        m_chunk_offset = 0;
        ++m_refills;
    }
    out = m_chunk[m_chunk_offset++];
    ++m_offset;
    return true;
}

} // namespace jsonevent
