// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_LEXER_H
#define JSONEVENT_LEXER_H

#include "options.h"
#include "source.h"
#include "token.h"
#include <cstdint>
#include <optional>

namespace jsonevent
{

// Character-level DFA that turns a Source into a lazy sequence of Tokens. The sequence can be
// consumed only once. Each call to next() reads as many characters as it needs to close the
// current token, plus at most one character that is held back for the following call.
class Lexer final
{
public:
    explicit Lexer(Source &source, const Options &options = {});

    Lexer(const Lexer &) = delete;
    auto operator=(const Lexer &) -> Lexer & = delete;

    // Produce the next token. Returns true if `out` was filled in and false at end of input.
    // Errors are terminal: once an error has been returned, it is returned by every later call.
    [[nodiscard]] auto next(Token &out) -> Result<bool>;

    // Position of the last character consumed from the source.
    [[nodiscard]] auto position() const -> const Position &
    {
        return m_pos;
    }

private:
    enum State {
        kIdle,
        kInNumber,
        kInString,
    };

    enum NumberState {
        kNegStart,      // Read '-'
        kZeroStart,     // Read a leading '0'
        kDigits,        // Read a leading '1'-'9', possibly followed by more digits
        kFracStart,     // Read '.'
        kFrac,          // Read at least one fractional digit
        kExpStart,      // Read 'e' or 'E'
        kExpSignStart,  // Read the exponent sign
        kExpDigits,     // Read at least one exponent digit
        kExpSignDigits, // Read the exponent sign and at least one digit
    };

    enum StringState {
        kChars,   // Plain characters
        kEscape,  // Read '\'
        kUnicode, // Collecting the 4 hex digits of a \u escape
    };

    [[nodiscard]] auto get(char &c) -> Result<bool>;
    auto unget(char c) -> void;
    [[nodiscard]] auto step_idle(char c, Token &out) -> Result<bool>;
    [[nodiscard]] auto step_number(char c, Token &out) -> Result<bool>;
    [[nodiscard]] auto step_string(char c, Token &out) -> Result<bool>;
    [[nodiscard]] auto finish(Token &out) -> Result<bool>;
    [[nodiscard]] auto match_literal(const char *suffix, const char *message) -> Result<bool>;
    [[nodiscard]] auto lex_error(const char *message) -> Err;
    [[nodiscard]] auto fail(Status s) -> Err;
    auto begin_number(NumberState state, char c) -> void;
    auto emit_number(Token &out) -> void;
    auto append_code_unit(std::uint32_t unit) -> void;
    auto flush_high_surrogate() -> void;

    Position m_pos;
    Status m_status;
    std::string m_buffer;
    std::optional<char> m_unget;
    Source *const m_source;
    State m_state = kIdle;
    NumberState m_number = kNegStart;
    StringState m_string = kChars;
    std::uint32_t m_code = 0;
    std::uint32_t m_high = 0;
    int m_hex_count = 0;
    bool m_eof = false;
    const bool m_combine_surrogates;
};

} // namespace jsonevent

#endif // JSONEVENT_LEXER_H
