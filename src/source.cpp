// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/source.h"
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace jsonevent
{

static auto errno_status(const std::string &name, const char *action) -> Status
{
    return Status::system_error(fmt::format(
        "cannot {} \"{}\": {}", action, name, std::strerror(errno)));
}

auto StringSource::read(char &out) -> Result<bool>
{
    if (m_offset >= m_text.size()) {
        return false;
    }
    out = m_text[m_offset++];
    return true;
}

FileSource::FileSource(std::FILE *file, std::string name, bool owned)
    : m_block(std::make_unique<char[]>(kBlockSize)),
      m_name(std::move(name)),
      m_file(file),
      m_owned(owned)
{
}

FileSource::~FileSource()
{
    if (m_owned && m_file) {
        std::fclose(m_file);
    }
}

auto FileSource::fill() -> Result<bool>
{
    m_offset = 0;
    m_length = std::fread(m_block.get(), 1, kBlockSize, m_file);
    if (m_length == 0) {
        if (std::ferror(m_file)) {
            return Err {errno_status(m_name, "read from")};
        }
        m_eof = true;
        return false;
    }
    return true;
}

auto FileSource::read(char &out) -> Result<bool>
{
    if (m_eof) {
        return false;
    }
    if (m_offset == m_length) {
        auto filled = fill();
        if (!filled || !*filled) {
            return filled;
        }
    }
    out = m_block[m_offset++];
    return true;
}

auto new_file_source(const std::string &path) -> Result<std::unique_ptr<Source>>
{
    auto *file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        return Err {errno_status(path, "open")};
    }
    return std::make_unique<FileSource>(file, path, true);
}

} // namespace jsonevent
