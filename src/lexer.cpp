// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/lexer.h"
#include "utils/expect.h"
#include <array>

namespace jsonevent
{

namespace
{

constexpr auto make_hex_table() -> std::array<std::int8_t, 256>
{
    std::array<std::int8_t, 256> table = {};
    for (auto &entry : table) {
        entry = -1;
    }
    for (int i = 0; i < 10; ++i) {
        table['0' + i] = static_cast<std::int8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table['a' + i] = static_cast<std::int8_t>(10 + i);
        table['A' + i] = static_cast<std::int8_t>(10 + i);
    }
    return table;
}

constexpr auto kHexTable = make_hex_table();

#define HEXVAL(c) (kHexTable[static_cast<std::uint8_t>(c)])

constexpr auto is_digit(char c) -> bool
{
    return '0' <= c && c <= '9';
}

constexpr auto is_high_surrogate(std::uint32_t unit) -> bool
{
    return 0xD800 <= unit && unit <= 0xDBFF;
}

constexpr auto is_low_surrogate(std::uint32_t unit) -> bool
{
    return 0xDC00 <= unit && unit <= 0xDFFF;
}

// Translate a code point (or a lone surrogate half) into bytes. Surrogate halves are encoded
// like any other value in the BMP, which yields the 3-byte generalized UTF-8 form.
auto append_utf8(std::string &out, std::uint32_t cp) -> void
{
    if (cp <= 0x7F) {
        out += static_cast<char>(cp);
    } else if (cp <= 0x7FF) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        JSONEVENT_EXPECT_LE(cp, 0x10FFFFU);
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

Lexer::Lexer(Source &source, const Options &options)
    : m_source(&source),
      m_combine_surrogates(options.combine_surrogates)
{
}

auto Lexer::next(Token &out) -> Result<bool>
{
    if (!m_status.is_ok()) {
        return Err {m_status};
    }
    for (;;) {
        char c;
        auto got = get(c);
        if (!got) {
            return fail(got.error());
        } else if (!*got) {
            return finish(out);
        }

        Result<bool> produced = false;
        switch (m_state) {
            case kIdle:
                produced = step_idle(c, out);
                break;
            case kInNumber:
                produced = step_number(c, out);
                break;
            case kInString:
                produced = step_string(c, out);
                break;
        }
        if (!produced || *produced) {
            return produced;
        }
    }
}

auto Lexer::get(char &c) -> Result<bool>
{
    // A character that was pushed back has already been counted.
    if (m_unget) {
        c = *m_unget;
        m_unget.reset();
        return true;
    }
    if (m_eof) {
        return false;
    }
    auto got = m_source->read(c);
    if (got && *got) {
        if (c == '\n') {
            ++m_pos.line;
            m_pos.column = 0;
        } else {
            ++m_pos.column;
        }
    } else if (got) {
        m_eof = true;
    }
    return got;
}

auto Lexer::unget(char c) -> void
{
    JSONEVENT_EXPECT_FALSE(m_unget.has_value());
    m_unget = c;
}

auto Lexer::fail(Status s) -> Err
{
    JSONEVENT_EXPECT_FALSE(s.is_ok());
    m_status = s;
    return Err {std::move(s)};
}

auto Lexer::lex_error(const char *message) -> Err
{
    return fail(Status::lex_error(message, m_pos));
}

auto Lexer::step_idle(char c, Token &out) -> Result<bool>
{
    switch (c) {
        case ' ':
        case '\t':
        case '\n':
        case '\r':
            return false;
        case 'f':
            out = {TokenKind::kBoolean, "false"};
            return match_literal("alse", "Expected `false`");
        case 't':
            out = {TokenKind::kBoolean, "true"};
            return match_literal("rue", "Expected `true`");
        case 'n':
            out = {TokenKind::kNull, "null"};
            return match_literal("ull", "Expected `null`");
        case '{':
            out = {TokenKind::kBeginObject, {}};
            return true;
        case '}':
            out = {TokenKind::kEndObject, {}};
            return true;
        case '[':
            out = {TokenKind::kBeginArray, {}};
            return true;
        case ']':
            out = {TokenKind::kEndArray, {}};
            return true;
        case ':':
            out = {TokenKind::kNameSeparator, {}};
            return true;
        case ',':
            out = {TokenKind::kValueSeparator, {}};
            return true;
        case '-':
            begin_number(kNegStart, c);
            return false;
        case '0':
            begin_number(kZeroStart, c);
            return false;
        case '"':
            m_state = kInString;
            m_string = kChars;
            m_buffer.clear();
            return false;
        default:
            if (is_digit(c)) {
                begin_number(kDigits, c);
                return false;
            }
            return lex_error("Unexpected char");
    }
}

// Read the rest of a true/false/null literal in one go. The whole suffix is consumed before
// it is compared, so a mismatch is reported after the last character of the attempt.
auto Lexer::match_literal(const char *suffix, const char *message) -> Result<bool>
{
    std::string text;
    for (const auto *p = suffix; *p != '\0'; ++p) {
        char c;
        auto got = get(c);
        if (!got) {
            return fail(got.error());
        } else if (!*got) {
            break;
        }
        text += c;
    }
    if (text != suffix) {
        return lex_error(message);
    }
    return true;
}

auto Lexer::begin_number(NumberState state, char c) -> void
{
    m_state = kInNumber;
    m_number = state;
    m_buffer.assign(1, c);
}

auto Lexer::emit_number(Token &out) -> void
{
    out.kind = m_number == kZeroStart || m_number == kDigits
                   ? TokenKind::kInteger
                   : TokenKind::kFloat;
    out.text = std::move(m_buffer);
    m_buffer.clear();
    m_state = kIdle;
}

auto Lexer::step_number(char c, Token &out) -> Result<bool>
{
    switch (m_number) {
        case kNegStart:
            if (c == '0') {
                m_number = kZeroStart;
            } else if (is_digit(c)) {
                m_number = kDigits;
            } else {
                return lex_error("Expected digit");
            }
            break;
        case kZeroStart:
        case kDigits:
            if (is_digit(c) && m_number == kDigits) {
                break;
            } else if (c == '.') {
                m_number = kFracStart;
                break;
            } else if (c == 'e' || c == 'E') {
                m_number = kExpStart;
                c = 'e';
                break;
            }
            // A '0' followed by another digit ends here: "01" is two integers.
            unget(c);
            emit_number(out);
            return true;
        case kFracStart:
            if (!is_digit(c)) {
                return lex_error("Missing decimals");
            }
            m_number = kFrac;
            break;
        case kFrac:
            if (is_digit(c)) {
                break;
            } else if (c == 'e' || c == 'E') {
                m_number = kExpStart;
                c = 'e';
                break;
            }
            unget(c);
            emit_number(out);
            return true;
        case kExpStart:
            if (c == '-' || c == '+') {
                m_number = kExpSignStart;
            } else if (is_digit(c)) {
                m_number = kExpDigits;
            } else {
                return lex_error("Missing exp");
            }
            break;
        case kExpSignStart:
            if (!is_digit(c)) {
                return lex_error("Missing exp");
            }
            m_number = kExpSignDigits;
            break;
        case kExpDigits:
        case kExpSignDigits:
            if (is_digit(c)) {
                break;
            }
            unget(c);
            emit_number(out);
            return true;
    }
    m_buffer += c;
    return false;
}

auto Lexer::step_string(char c, Token &out) -> Result<bool>
{
    switch (m_string) {
        case kChars:
            if (c == '"') {
                flush_high_surrogate();
                out.kind = TokenKind::kString;
                out.text = std::move(m_buffer);
                m_buffer.clear();
                m_state = kIdle;
                return true;
            } else if (c == '\\') {
                // Keep a pending high surrogate around: this may be the start of its partner.
                m_string = kEscape;
                return false;
            } else if (static_cast<std::uint8_t>(c) < 0x20) {
                return lex_error("Unescaped control char");
            }
            flush_high_surrogate();
            m_buffer += c;
            return false;
        case kEscape:
            if (c == 'u') {
                m_string = kUnicode;
                m_code = 0;
                m_hex_count = 0;
                return false;
            }
            flush_high_surrogate();
            switch (c) {
                case '"':
                case '\\':
                case '/':
                    m_buffer += c;
                    break;
                case 'b':
                    m_buffer += '\b';
                    break;
                case 'f':
                    m_buffer += '\f';
                    break;
                case 'n':
                    m_buffer += '\n';
                    break;
                case 'r':
                    m_buffer += '\r';
                    break;
                case 't':
                    m_buffer += '\t';
                    break;
                default:
                    return lex_error("Unknown escaped char");
            }
            m_string = kChars;
            return false;
        case kUnicode:
            if (HEXVAL(c) < 0) {
                return lex_error("Expected hex digit");
            }
            m_code = m_code << 4 | static_cast<std::uint32_t>(HEXVAL(c));
            if (++m_hex_count == 4) {
                append_code_unit(m_code);
                m_string = kChars;
            }
            return false;
    }
    return false;
}

auto Lexer::append_code_unit(std::uint32_t unit) -> void
{
    if (m_combine_surrogates) {
        if (m_high != 0) {
            if (is_low_surrogate(unit)) {
                append_utf8(m_buffer, 0x10000 + ((m_high - 0xD800) << 10) + (unit - 0xDC00));
                m_high = 0;
                return;
            }
            flush_high_surrogate();
        }
        if (is_high_surrogate(unit)) {
            m_high = unit;
            return;
        }
    }
    append_utf8(m_buffer, unit);
}

auto Lexer::flush_high_surrogate() -> void
{
    if (m_high != 0) {
        append_utf8(m_buffer, m_high);
        m_high = 0;
    }
}

auto Lexer::finish(Token &out) -> Result<bool>
{
    switch (m_state) {
        case kIdle:
            return false;
        case kInString:
            return lex_error("Missing end quote");
        case kInNumber:
            break;
    }
    // A number that is complete when the input runs out is still a valid token.
    switch (m_number) {
        case kNegStart:
            return lex_error("Missing digits");
        case kFracStart:
            return lex_error("Missing decimals");
        case kExpStart:
        case kExpSignStart:
            return lex_error("Missing exp");
        default:
            emit_number(out);
            return true;
    }
}

#undef HEXVAL

} // namespace jsonevent
