// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/token.h"
#include "utils/expect.h"
#include "utils/logging.h"
#include <fmt/format.h>

namespace jsonevent
{

auto token_kind_name(TokenKind kind) -> const char *
{
    switch (kind) {
        case TokenKind::kBoolean:
            return "boolean-value";
        case TokenKind::kNull:
            return "null-value";
        case TokenKind::kString:
            return "string";
        case TokenKind::kInteger:
            return "int-value";
        case TokenKind::kFloat:
            return "float-value";
        case TokenKind::kBeginObject:
            return "begin-object";
        case TokenKind::kEndObject:
            return "end-object";
        case TokenKind::kBeginArray:
            return "begin-array";
        case TokenKind::kEndArray:
            return "end-array";
        case TokenKind::kNameSeparator:
            return "name-separator";
        case TokenKind::kValueSeparator:
            return "value-separator";
    }
    return "unknown";
}

auto event_kind_name(EventKind kind) -> const char *
{
    if (kind == EventKind::kObjectKey) {
        return "object-key";
    }
    return token_kind_name(static_cast<TokenKind>(kind));
}

auto is_scalar(TokenKind kind) -> bool
{
    return kind < TokenKind::kBeginObject;
}

auto is_scalar(EventKind kind) -> bool
{
    return kind < EventKind::kBeginObject;
}

auto to_event(Token token) -> Event
{
    JSONEVENT_EXPECT_TRUE(token.kind != TokenKind::kNameSeparator &&
                          token.kind != TokenKind::kValueSeparator);
    return {static_cast<EventKind>(token.kind), std::move(token.text)};
}

auto describe(const Token &token) -> std::string
{
    if (token.has_literal()) {
        return fmt::format("{} \"{}\"", token_kind_name(token.kind), escape_string(token.text));
    }
    return token_kind_name(token.kind);
}

auto describe(const Event &event) -> std::string
{
    if (event.has_literal()) {
        return fmt::format("{} \"{}\"", event_kind_name(event.kind), escape_string(event.text));
    }
    return event_kind_name(event.kind);
}

auto operator<<(std::ostream &os, const Token &token) -> std::ostream &
{
    return os << describe(token);
}

auto operator<<(std::ostream &os, const Event &event) -> std::ostream &
{
    return os << describe(event);
}

} // namespace jsonevent
