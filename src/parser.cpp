// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/parser.h"
#include "utils/expect.h"
#include "utils/system.h"
#include <algorithm>
#include <fmt/format.h>

namespace jsonevent
{

Parser::Parser(Source &source, const Options &options)
    : m_lexer(source, options),
      m_max_depth(sanitize_options(options).max_depth)
{
    // The logger keeps the sink alive, so the System is not needed past this point.
    m_log = System(sanitize_options(options)).create_log("parser");
}

Parser::~Parser() = default;

auto Parser::state_name(State state) -> const char *
{
    switch (state) {
        case kStart:
            return "Start";
        case kInArray:
            return "InArray";
        case kInArrayNext:
            return "InArrayNext";
        case kInArraySep:
            return "InArraySep";
        case kInObject:
            return "InObject";
        case kInObjectNext:
            return "InObjectNext";
        case kInObjectMember:
            return "InObjectMember";
        case kInObjectMemberValue:
            return "InObjectMemberValue";
        case kInObjectSep:
            return "InObjectSep";
        case kEnd:
            return "End";
        case kDone:
            return "Done";
    }
    return "Unknown";
}

auto Parser::next(Event &out) -> Result<bool>
{
    if (!m_status.is_ok()) {
        return Err {m_status};
    } else if (m_state == kDone) {
        return false;
    }
    Token token;
    for (;;) {
        auto got = m_lexer.next(token);
        if (!got) {
            return fail(got.error());
        } else if (!*got) {
            return finish();
        }
        auto produced = step(token, out);
        if (!produced || *produced) {
            return produced;
        }
    }
}

auto Parser::step(Token &token, Event &out) -> Result<bool>
{
    switch (m_state) {
        case kStart:
            return accept_value(token, kEnd, "as document value", out);

        case kInArray:
            if (token.kind == TokenKind::kEndArray) {
                return close(token, out);
            }
            return accept_value(token, kInArraySep, "as array element", out);

        case kInArrayNext:
            return accept_value(token, kInArraySep, "as array element", out);

        case kInArraySep:
            if (token.kind == TokenKind::kEndArray) {
                return close(token, out);
            } else if (token.kind == TokenKind::kValueSeparator) {
                m_state = kInArrayNext;
                return false;
            }
            return unexpected(token, ", expected value-separator or end-array");

        case kInObject:
            if (token.kind == TokenKind::kEndObject) {
                return close(token, out);
            }
            return accept_key(token, "as object member", out);

        case kInObjectNext:
            return accept_key(token, "as object member", out);

        case kInObjectMember:
            if (token.kind == TokenKind::kNameSeparator) {
                m_state = kInObjectMemberValue;
                return false;
            }
            return unexpected(token, ", expected name-separator");

        case kInObjectMemberValue:
            return accept_value(token, kInObjectSep, "as member value", out);

        case kInObjectSep:
            if (token.kind == TokenKind::kEndObject) {
                return close(token, out);
            } else if (token.kind == TokenKind::kValueSeparator) {
                m_state = kInObjectNext;
                return false;
            }
            return unexpected(token, ", expected value-separator or end-object");

        default:
            JSONEVENT_EXPECT_EQ(m_state, kEnd);
            return unexpected(token, "after end of document");
    }
}

// Accept a scalar, or open a nested structure. `after` is the state to enter once the value
// has been read completely. For a nested structure it is saved on the stack and restored by
// close().
auto Parser::accept_value(Token &token, State after, const char *context, Event &out) -> Result<bool>
{
    if (is_scalar(token.kind)) {
        m_state = after;
        return emit(token, out);
    }
    if (token.kind != TokenKind::kBeginArray && token.kind != TokenKind::kBeginObject) {
        return unexpected(token, context);
    }
    if (m_stack.size() >= m_max_depth) {
        return parse_error(fmt::format("Exceeded maximum nesting depth {}", m_max_depth));
    }
    m_stack.push_back(after);
    m_deepest = std::max<Size>(m_deepest, m_stack.size());
    m_state = token.kind == TokenKind::kBeginArray ? kInArray : kInObject;
    m_log->trace("enter {} at depth {}", token_kind_name(token.kind), m_stack.size());
    return emit(token, out);
}

auto Parser::accept_key(Token &token, const char *context, Event &out) -> Result<bool>
{
    if (token.kind != TokenKind::kString) {
        return unexpected(token, context);
    }
    m_state = kInObjectMember;
    out.kind = EventKind::kObjectKey;
    out.text = std::move(token.text);
    ++m_event_count;
    return true;
}

auto Parser::close(Token &token, Event &out) -> Result<bool>
{
    JSONEVENT_EXPECT_FALSE(m_stack.empty());
    m_log->trace("leave {} at depth {}", token_kind_name(token.kind), m_stack.size());
    m_state = m_stack.back();
    m_stack.pop_back();
    return emit(token, out);
}

auto Parser::emit(Token &token, Event &out) -> Result<bool>
{
    out = to_event(std::move(token));
    ++m_event_count;
    return true;
}

// Handle end of input. Only a completed top-level value may be followed by end of input.
auto Parser::finish() -> Result<bool>
{
    if (m_state == kEnd) {
        JSONEVENT_EXPECT_TRUE(m_stack.empty());
        m_log->info("validated document: {} events, maximum depth {}", m_event_count, m_deepest);
        m_state = kDone;
        return false;
    } else if (m_state == kStart) {
        return parse_error("Unexpected end of input, expected value");
    }
    return parse_error(fmt::format("Unexpected end of input in state {}", state_name(m_state)));
}

auto Parser::unexpected(const Token &token, const char *context) -> Err
{
    // Contexts that start with a comma attach directly to the token description.
    const auto *sep = *context == ',' ? "" : " ";
    return parse_error(fmt::format("Unexpected {}{}{}", describe(token), sep, context));
}

auto Parser::parse_error(const std::string &message) -> Err
{
    return fail(Status::parse_error(message, m_lexer.position()));
}

auto Parser::fail(Status s) -> Err
{
    JSONEVENT_EXPECT_FALSE(s.is_ok());
    m_log->error("{}", s.to_string());
    m_status = s;
    return Err {std::move(s)};
}

auto for_each_event(Source &source, const Options &options,
                    const std::function<bool(const Event &)> &callback) -> Status
{
    Parser parser(source, options);
    Event event;
    for (;;) {
        auto got = parser.next(event);
        if (!got) {
            return got.error();
        } else if (!*got || !callback(event)) {
            return Status::ok();
        }
    }
}

} // namespace jsonevent
