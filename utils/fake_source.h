// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_UTILS_FAKE_SOURCE_H
#define JSONEVENT_UTILS_FAKE_SOURCE_H

#include "jsonevent/source.h"
#include <string>
#include <vector>

namespace jsonevent
{

// In-memory Source that hands its text over in chunks, the way a file or pipe would, and that
// can be told to fail. Chunking is only observable through the counters: the characters
// produced are always the same.
class FakeSource : public Source
{
public:
    explicit FakeSource(std::string text, size_t chunk_size = 1);
    ~FakeSource() override = default;

    [[nodiscard]] auto read(char &out) -> Result<bool> override;

    // Make read() return a system error once `n` characters have been produced. The error is
    // returned on every later call.
    auto fail_after(size_t n) -> void
    {
        m_fail_after = n;
    }

    // Number of characters handed out so far.
    [[nodiscard]] auto consumed() const -> size_t
    {
        return m_offset;
    }

    // Number of times a new chunk was fetched.
    [[nodiscard]] auto refill_count() const -> size_t
    {
        return m_refills;
    }

    // Number of read() calls made after end of input was first reported.
    [[nodiscard]] auto reads_after_eof() const -> size_t
    {
        return m_reads_after_eof;
    }

private:
    std::string m_text;
    std::vector<char> m_chunk;
    size_t m_chunk_size;
    size_t m_chunk_offset = 0;
    size_t m_offset = 0;
    size_t m_fail_after = static_cast<size_t>(-1);
    size_t m_refills = 0;
    size_t m_reads_after_eof = 0;
    bool m_eof = false;
};

} // namespace jsonevent

#endif // JSONEVENT_UTILS_FAKE_SOURCE_H
