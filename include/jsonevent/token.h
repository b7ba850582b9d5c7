// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_TOKEN_H
#define JSONEVENT_TOKEN_H

#include "slice.h"
#include <ostream>
#include <string>

namespace jsonevent
{

// Lexical categories produced by the lexer. Scalar kinds come first so that an event kind can
// share the same value as the token kind it was produced from.
enum class TokenKind {
    kBoolean,
    kNull,
    kString,
    kInteger,
    kFloat,
    kBeginObject,
    kEndObject,
    kBeginArray,
    kEndArray,
    kNameSeparator,
    kValueSeparator,
};

// Events produced by the parser. Separators are consumed by the grammar and never reach the
// caller. kObjectKey replaces the string token that names an object member.
enum class EventKind {
    kBoolean = static_cast<int>(TokenKind::kBoolean),
    kNull = static_cast<int>(TokenKind::kNull),
    kString = static_cast<int>(TokenKind::kString),
    kInteger = static_cast<int>(TokenKind::kInteger),
    kFloat = static_cast<int>(TokenKind::kFloat),
    kBeginObject = static_cast<int>(TokenKind::kBeginObject),
    kEndObject = static_cast<int>(TokenKind::kEndObject),
    kBeginArray = static_cast<int>(TokenKind::kBeginArray),
    kEndArray = static_cast<int>(TokenKind::kEndArray),
    kObjectKey = 100,
};

[[nodiscard]] auto token_kind_name(TokenKind kind) -> const char *;
[[nodiscard]] auto event_kind_name(EventKind kind) -> const char *;

// True for kinds that carry a literal: strings, numbers, booleans and null.
[[nodiscard]] auto is_scalar(TokenKind kind) -> bool;
[[nodiscard]] auto is_scalar(EventKind kind) -> bool;

// A classified lexical unit. For strings, `text` holds the unescaped contents. For numbers it
// holds the number exactly as written (sign and digits preserved, 'E' lowered to 'e'). Booleans
// and null hold "true", "false" or "null". Structural tokens have an empty `text`.
struct Token {
    TokenKind kind = TokenKind::kNull;
    std::string text;

    [[nodiscard]] auto has_literal() const -> bool
    {
        return is_scalar(kind);
    }
};

struct Event {
    EventKind kind = EventKind::kNull;
    std::string text;

    [[nodiscard]] auto has_literal() const -> bool
    {
        return kind == EventKind::kObjectKey || is_scalar(kind);
    }
};

inline auto operator==(const Token &lhs, const Token &rhs) -> bool
{
    return lhs.kind == rhs.kind && lhs.text == rhs.text;
}

inline auto operator!=(const Token &lhs, const Token &rhs) -> bool
{
    return !(lhs == rhs);
}

inline auto operator==(const Event &lhs, const Event &rhs) -> bool
{
    return lhs.kind == rhs.kind && lhs.text == rhs.text;
}

inline auto operator!=(const Event &lhs, const Event &rhs) -> bool
{
    return !(lhs == rhs);
}

// Convert a token that the grammar passes through unchanged into an event.
[[nodiscard]] auto to_event(Token token) -> Event;

// Short description used in diagnostics, e.g. `int-value "42"` or `end-array`.
[[nodiscard]] auto describe(const Token &token) -> std::string;
[[nodiscard]] auto describe(const Event &event) -> std::string;

auto operator<<(std::ostream &os, const Token &token) -> std::ostream &;
auto operator<<(std::ostream &os, const Event &event) -> std::ostream &;

} // namespace jsonevent

#endif // JSONEVENT_TOKEN_H
