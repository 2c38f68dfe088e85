#pragma once

#include <string>

#include "pos.hpp"
#include "token_kind.hpp"

namespace linescript {

struct Token {
    TokenKind kind = TokenKind::END;

    // Numeric text, identifier text or string contents depending on kind.
    // Numbers are kept as text and converted by the parser.
    std::string str;

    bool b_value = false;

    Pos pos;
};

}  // namespace linescript
