// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/status.h"
#include <cstring>
#include <fmt/format.h>

namespace jsonevent
{

// Layout of a non-OK status: the code byte, the line and column, then the message and a '\0'.
static constexpr size_t kLineOffset = sizeof(Byte);
static constexpr size_t kColumnOffset = kLineOffset + sizeof(Size);
static constexpr size_t kMessageOffset = kColumnOffset + sizeof(Size);

static auto maybe_copy_data(const Byte *data) -> std::unique_ptr<Byte[]>
{
    // Status is OK, so there isn't anything to copy.
    if (data == nullptr) {
        return nullptr;
    }
    const auto total_size = kMessageOffset + std::char_traits<Byte>::length(data + kMessageOffset) + 1;
    auto copy = std::make_unique<Byte[]>(total_size);
    std::memcpy(copy.get(), data, total_size);
    return copy;
}

static auto read_size(const Byte *ptr) -> Size
{
    Size value;
    std::memcpy(&value, ptr, sizeof(value));
    return value;
}

Status::Status(Code code, const Slice &what, const Position &pos)
    : m_data(std::make_unique<Byte[]>(kMessageOffset + what.size() + 1))
{
    auto *ptr = m_data.get();

    // The first byte holds the status type.
    ptr[0] = code;
    std::memcpy(ptr + kLineOffset, &pos.line, sizeof(pos.line));
    std::memcpy(ptr + kColumnOffset, &pos.column, sizeof(pos.column));

    // std::make_unique<Byte[]>() value-initializes, so the trailing '\0' is already there.
    std::memcpy(ptr + kMessageOffset, what.data(), what.size());
}

Status::Status(const Status &rhs)
    : m_data(maybe_copy_data(rhs.m_data.get()))
{
}

Status::Status(Status &&rhs) noexcept
    : m_data(std::move(rhs.m_data))
{
}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (this != &rhs) {
        m_data = maybe_copy_data(rhs.m_data.get());
    }
    return *this;
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    if (this != &rhs) {
        m_data = std::move(rhs.m_data);
    }
    return *this;
}

auto Status::ok() -> Status
{
    return {};
}

auto Status::lex_error(const Slice &what, const Position &pos) -> Status
{
    return {kLexError, what, pos};
}

auto Status::parse_error(const Slice &what, const Position &pos) -> Status
{
    return {kParseError, what, pos};
}

auto Status::system_error(const Slice &what) -> Status
{
    return {kSystemError, what, {}};
}

auto Status::invalid_argument(const Slice &what) -> Status
{
    return {kInvalidArgument, what, {}};
}

auto Status::code() const -> Code
{
    return static_cast<Code>(m_data[0]);
}

auto Status::is_lex_error() const -> bool
{
    return !is_ok() && code() == kLexError;
}

auto Status::is_parse_error() const -> bool
{
    return !is_ok() && code() == kParseError;
}

auto Status::is_system_error() const -> bool
{
    return !is_ok() && code() == kSystemError;
}

auto Status::is_invalid_argument() const -> bool
{
    return !is_ok() && code() == kInvalidArgument;
}

auto Status::what() const -> Slice
{
    return m_data ? Slice(m_data.get() + kMessageOffset) : Slice();
}

auto Status::position() const -> Position
{
    if (is_ok()) {
        return {};
    }
    return {read_size(m_data.get() + kLineOffset),
            read_size(m_data.get() + kColumnOffset)};
}

auto Status::to_string() const -> std::string
{
    if (is_ok()) {
        return "OK";
    }
    const auto message = what().to_view();
    switch (code()) {
        case kLexError:
            return fmt::format("LexError: {} at {}:{}", message, line(), column());
        case kParseError:
            return fmt::format("ParseError: {} at {}:{}", message, line(), column());
        case kSystemError:
            return fmt::format("SystemError: {}", message);
        default:
            return fmt::format("InvalidArgument: {}", message);
    }
}

} // namespace jsonevent
