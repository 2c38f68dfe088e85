#pragma once

#include <cstdint>

namespace linescript {

enum class TokenKind : std::uint8_t {
    OPENPAREN,
    CLOSEPAREN,
    SEMI,

    PLUS,
    MINUS,
    STAR,
    SLASH,
    ASSIGN,

    EQUALS,
    NOT_EQUALS,
    LT,
    GT,

    AND,
    OR,
    NOT,

    NUMBER,
    STRING,
    BOOL,

    IDENT,

    PRINT,

    END
};

const char* token_kind_name(TokenKind kind);

}  // namespace linescript
