// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_SOURCE_H
#define JSONEVENT_SOURCE_H

#include "result.h"
#include <cstdio>
#include <memory>
#include <string>

namespace jsonevent
{

// Pull-based character source. Text is expected to be decoded upstream: the lexer consumes
// whatever characters read() hands it.
class Source
{
public:
    virtual ~Source() = default;

    // Read the next character into `out`. Returns true if a character was produced and false
    // at end of input. Once end of input has been reported, it keeps being reported.
    [[nodiscard]] virtual auto read(char &out) -> Result<bool> = 0;
};

class StringSource final : public Source
{
public:
    explicit StringSource(const Slice &text)
        : m_text(text.to_string())
    {
    }

    ~StringSource() override = default;

    [[nodiscard]] auto read(char &out) -> Result<bool> override;

private:
    std::string m_text;
    size_t m_offset = 0;
};

class FileSource final : public Source
{
public:
    static constexpr size_t kBlockSize = 0x1000;

    // Read from an already-open file, such as stdin. If `owned` is true, the file is closed
    // when this object is destroyed.
    explicit FileSource(std::FILE *file, std::string name, bool owned = false);
    ~FileSource() override;

    FileSource(const FileSource &) = delete;
    auto operator=(const FileSource &) -> FileSource & = delete;

    [[nodiscard]] auto read(char &out) -> Result<bool> override;

private:
    auto fill() -> Result<bool>;

    std::unique_ptr<char[]> m_block;
    std::string m_name;
    std::FILE *m_file;
    size_t m_offset = 0;
    size_t m_length = 0;
    bool m_owned;
    bool m_eof = false;
};

// Open the file at `path` for reading.
[[nodiscard]] auto new_file_source(const std::string &path) -> Result<std::unique_ptr<Source>>;

} // namespace jsonevent

#endif // JSONEVENT_SOURCE_H
