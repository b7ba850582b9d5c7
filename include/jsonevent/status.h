// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_STATUS_H
#define JSONEVENT_STATUS_H

#include "slice.h"
#include <memory>

namespace jsonevent
{

class Status final
{
public:
    // Construct an OK status. No allocation is needed.
    Status() = default;

    /*
     * Create an OK status.
     */
    [[nodiscard]] static auto ok() -> Status;

    /*
     * Create a non-OK status. Lex and parse errors remember where in the input they were raised.
     */
    [[nodiscard]] static auto lex_error(const Slice &what, const Position &pos) -> Status;
    [[nodiscard]] static auto parse_error(const Slice &what, const Position &pos) -> Status;
    [[nodiscard]] static auto system_error(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_argument(const Slice &what) -> Status;

    /*
     * Check status type.
     */
    [[nodiscard]] auto is_ok() const -> bool
    {
        return m_data == nullptr;
    }

    [[nodiscard]] auto is_lex_error() const -> bool;
    [[nodiscard]] auto is_parse_error() const -> bool;
    [[nodiscard]] auto is_system_error() const -> bool;
    [[nodiscard]] auto is_invalid_argument() const -> bool;

    /*
     * Get the error message, if it exists. An OK status has an empty message.
     */
    [[nodiscard]] auto what() const -> Slice;

    // Position attached to a lex or parse error. Other statuses report {0, 0}.
    [[nodiscard]] auto position() const -> Position;

    [[nodiscard]] auto line() const -> Size
    {
        return position().line;
    }

    [[nodiscard]] auto column() const -> Size
    {
        return position().column;
    }

    // Display form, e.g. "LexError: Missing decimals at 0:2".
    [[nodiscard]] auto to_string() const -> std::string;

    // Status can be copied and moved.
    Status(const Status &rhs);
    auto operator=(const Status &rhs) -> Status &;
    Status(Status &&rhs) noexcept;
    auto operator=(Status &&rhs) noexcept -> Status &;

private:
    enum Code : Byte {
        kLexError = 1,
        kParseError = 2,
        kSystemError = 3,
        kInvalidArgument = 4,
    };

    Status(Code code, const Slice &what, const Position &pos);

    [[nodiscard]] auto code() const -> Code;

    // Storage for a status code, a position, and a message.
    std::unique_ptr<Byte[]> m_data;
};

// Status object should be the size of a pointer.
static_assert(sizeof(Status) == sizeof(void *));

} // namespace jsonevent

#endif // JSONEVENT_STATUS_H
