#pragma once

#include <optional>
#include <string>

#include "error.hpp"
#include "pos.hpp"
#include "token.hpp"

namespace linescript {

// Pull-based tokenizer over a single line of source text.
struct Lexer {
    // pos supplies the line number and filename, columns are computed.
    Lexer(std::string src, Pos pos);

    // Reads the next token into token(). After the end of the line is reached
    // this keeps producing END.
    std::optional<Error> next_token();

    // Nothing has been read until the first call to next_token, so this
    // is END on a fresh lexer.
    const Token& token() const;

    bool started() const;

private:
    std::string m_src;
    std::size_t m_i = 0;

    Pos m_pos;

    bool m_started = false;

    Token m_tok;

    int peek(std::size_t offset = 0) const;
    Pos pos_at(std::size_t i) const;

    Error error_at(std::size_t i, std::string message) const;

    void scan_number();
    void scan_word();
    std::optional<Error> scan_string();
};

}  // namespace linescript
