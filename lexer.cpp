#include "lexer.hpp"

#include <array>
#include <string_view>

namespace {

struct Entity {
    std::string_view str;
    linescript::TokenKind token_kind;
};

constexpr std::array<Entity, 6> SINGLE_CHARS{{{"(", linescript::TokenKind::OPENPAREN},
                                              {")", linescript::TokenKind::CLOSEPAREN},
                                              {";", linescript::TokenKind::SEMI},
                                              {"+", linescript::TokenKind::PLUS},
                                              {"*", linescript::TokenKind::STAR},
                                              {"/", linescript::TokenKind::SLASH}}};

// Longer spellings come first so that they win over their one character prefix.
constexpr std::array<Entity, 9> OPERATORS{{{"!=", linescript::TokenKind::NOT_EQUALS},
                                           {"==", linescript::TokenKind::EQUALS},

                                           {"!", linescript::TokenKind::NOT},
                                           {"=", linescript::TokenKind::ASSIGN},
                                           {"<", linescript::TokenKind::LT},
                                           {">", linescript::TokenKind::GT},
                                           {"&", linescript::TokenKind::AND},
                                           {"|", linescript::TokenKind::OR},
                                           {"-", linescript::TokenKind::MINUS}}};

constexpr std::array<Entity, 3> KEYWORDS{{{"and", linescript::TokenKind::AND},
                                          {"or", linescript::TokenKind::OR},
                                          {"print", linescript::TokenKind::PRINT}}};

constexpr int EOF_CHAR = -1;

constexpr bool is_whitespace(int ch) {
    return ch == '\n' || ch == '\r' || ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v';
}

constexpr bool is_letter(int ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool is_digit(int ch) { return ch >= '0' && ch <= '9'; }

constexpr bool is_letter_or_digit(int ch) { return is_letter(ch) || is_digit(ch); }

}  // namespace

namespace linescript {

Lexer::Lexer(std::string src, Pos pos) : m_src{std::move(src)}, m_pos{std::move(pos)} {
    m_tok.pos = pos_at(0);
}

std::optional<Error> Lexer::next_token() {
    m_started = true;

    m_tok.str.clear();
    m_tok.b_value = false;

    while (is_whitespace(peek())) {
        ++m_i;
    }

    m_tok.pos = pos_at(m_i);

    const int ch = peek();

    if (ch == EOF_CHAR) {
        m_tok.kind = TokenKind::END;
        return std::nullopt;
    }

    // A minus sign directly attached to a digit is part of the literal,
    // so "x -1" lexes as an identifier followed by the number -1.
    if (is_digit(ch) || (ch == '-' && is_digit(peek(1)))) {
        scan_number();
        return std::nullopt;
    }

    if (is_letter(ch)) {
        scan_word();
        return std::nullopt;
    }

    if (ch == '"') {
        return scan_string();
    }

    for (const auto& single : SINGLE_CHARS) {
        if (ch == single.str[0]) {
            ++m_i;
            m_tok.kind = single.token_kind;
            return std::nullopt;
        }
    }

    const std::string_view rest{m_src.data() + m_i, m_src.size() - m_i};

    for (const auto& op : OPERATORS) {
        if (rest.substr(0, op.str.size()) == op.str) {
            m_i += op.str.size();
            m_tok.kind = op.token_kind;
            return std::nullopt;
        }
    }

    return error_at(m_i, std::string{"Unexpected character '"} + static_cast<char>(ch) + "'");
}

const Token& Lexer::token() const { return m_tok; }

bool Lexer::started() const { return m_started; }

int Lexer::peek(std::size_t offset) const {
    const auto i = m_i + offset;

    if (i >= m_src.size()) {
        return EOF_CHAR;
    }

    return static_cast<unsigned char>(m_src[i]);
}

Pos Lexer::pos_at(std::size_t i) const {
    Pos pos = m_pos;
    pos.column = static_cast<int>(i) + 1;
    return pos;
}

Error Lexer::error_at(std::size_t i, std::string message) const {
    return Error{ErrorKind::LEX, pos_at(i), std::move(message)};
}

void Lexer::scan_number() {
    const auto start = m_i;

    if (peek() == '-') {
        ++m_i;
    }

    // Digits and decimal points are taken as they come; "1.2.3" is
    // rejected later when the parser converts the text.
    while (is_digit(peek()) || peek() == '.') {
        ++m_i;
    }

    m_tok.kind = TokenKind::NUMBER;
    m_tok.str = m_src.substr(start, m_i - start);
}

void Lexer::scan_word() {
    const auto start = m_i;

    while (is_letter_or_digit(peek())) {
        ++m_i;
    }

    m_tok.str = m_src.substr(start, m_i - start);

    for (const auto& kw : KEYWORDS) {
        if (m_tok.str == kw.str) {
            m_tok.kind = kw.token_kind;
            return;
        }
    }

    if (m_tok.str == "true" || m_tok.str == "false") {
        m_tok.b_value = m_tok.str == "true";
        m_tok.kind = TokenKind::BOOL;
        return;
    }

    m_tok.kind = TokenKind::IDENT;
}

std::optional<Error> Lexer::scan_string() {
    const auto quote = m_i;

    // No escape sequences, the literal ends at the next quote.
    ++m_i;

    const auto start = m_i;

    while (peek() != EOF_CHAR && peek() != '"') {
        ++m_i;
    }

    if (peek() != '"') {
        return error_at(quote, "Expected \" to terminate string literal");
    }

    m_tok.kind = TokenKind::STRING;
    m_tok.str = m_src.substr(start, m_i - start);

    ++m_i;

    return std::nullopt;
}

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::OPENPAREN:
            return "'('";
        case TokenKind::CLOSEPAREN:
            return "')'";
        case TokenKind::SEMI:
            return "';'";
        case TokenKind::PLUS:
            return "'+'";
        case TokenKind::MINUS:
            return "'-'";
        case TokenKind::STAR:
            return "'*'";
        case TokenKind::SLASH:
            return "'/'";
        case TokenKind::ASSIGN:
            return "'='";
        case TokenKind::EQUALS:
            return "'=='";
        case TokenKind::NOT_EQUALS:
            return "'!='";
        case TokenKind::LT:
            return "'<'";
        case TokenKind::GT:
            return "'>'";
        case TokenKind::AND:
            return "'and'";
        case TokenKind::OR:
            return "'or'";
        case TokenKind::NOT:
            return "'!'";
        case TokenKind::NUMBER:
            return "number";
        case TokenKind::STRING:
            return "string";
        case TokenKind::BOOL:
            return "boolean";
        case TokenKind::IDENT:
            return "identifier";
        case TokenKind::PRINT:
            return "'print'";
        case TokenKind::END:
            return "end of line";
    }

    return "unknown token";
}

}  // namespace linescript
