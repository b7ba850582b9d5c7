// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_PARSER_H
#define JSONEVENT_PARSER_H

#include "lexer.h"
#include <functional>
#include <memory>
#include <vector>

namespace spdlog
{
class logger;
} // namespace spdlog

namespace jsonevent
{

// Pushdown automaton that validates the token sequence produced by a Lexer against the JSON
// grammar and forwards it as a sequence of Events. Separators are swallowed, and a string
// token that names an object member is reported as kObjectKey.
//
// Exactly one top-level value is accepted. Once it has been closed, the parser reads one more
// token: anything other than end of input is an error.
class Parser final
{
public:
    explicit Parser(Source &source, const Options &options = {});
    ~Parser();

    Parser(const Parser &) = delete;
    auto operator=(const Parser &) -> Parser & = delete;

    // Produce the next event. Returns true if `out` was filled in and false once the document
    // has been fully validated. Errors are terminal, just like in the lexer.
    [[nodiscard]] auto next(Event &out) -> Result<bool>;

    // Position of the lexer. Parse errors are reported at this position, which is just past the
    // offending token.
    [[nodiscard]] auto position() const -> const Position &
    {
        return m_lexer.position();
    }

    // Number of arrays and objects that are currently open.
    [[nodiscard]] auto depth() const -> Size
    {
        return m_stack.size();
    }

private:
    enum State {
        kStart,               // Expecting the top-level value
        kInArray,             // Read '[', expecting an element or ']'
        kInArrayNext,         // Read ',' in an array, expecting an element
        kInArraySep,          // Read an element, expecting ',' or ']'
        kInObject,            // Read '{', expecting a key or '}'
        kInObjectNext,        // Read ',' in an object, expecting a key
        kInObjectMember,      // Read a key, expecting ':'
        kInObjectMemberValue, // Read ':', expecting a value
        kInObjectSep,         // Read a member value, expecting ',' or '}'
        kEnd,                 // Top-level value is complete
        kDone,                // Reached end of input after a complete value
    };

    [[nodiscard]] static auto state_name(State state) -> const char *;
    [[nodiscard]] auto step(Token &token, Event &out) -> Result<bool>;
    [[nodiscard]] auto accept_value(Token &token, State after, const char *context, Event &out) -> Result<bool>;
    [[nodiscard]] auto accept_key(Token &token, const char *context, Event &out) -> Result<bool>;
    [[nodiscard]] auto close(Token &token, Event &out) -> Result<bool>;
    [[nodiscard]] auto finish() -> Result<bool>;
    [[nodiscard]] auto unexpected(const Token &token, const char *context) -> Err;
    [[nodiscard]] auto parse_error(const std::string &message) -> Err;
    [[nodiscard]] auto fail(Status s) -> Err;
    [[nodiscard]] auto emit(Token &token, Event &out) -> Result<bool>;

    Lexer m_lexer;
    Status m_status;
    std::vector<State> m_stack;
    std::shared_ptr<spdlog::logger> m_log;
    Size m_max_depth;
    Size m_deepest = 0;
    Size m_event_count = 0;
    State m_state = kStart;
};

// Run a parser over `source` to completion, handing each event to `callback`. Stops early,
// returning OK, if `callback` returns false.
[[nodiscard]] auto for_each_event(Source &source, const Options &options,
                                  const std::function<bool(const Event &)> &callback) -> Status;

} // namespace jsonevent

#endif // JSONEVENT_PARSER_H
