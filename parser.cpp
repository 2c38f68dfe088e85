#include "parser.hpp"

#include <cstdlib>

namespace {

bool is_or(linescript::TokenKind token) { return token == linescript::TokenKind::OR; }

bool is_and(linescript::TokenKind token) { return token == linescript::TokenKind::AND; }

bool is_equality(linescript::TokenKind token) {
    return token == linescript::TokenKind::EQUALS || token == linescript::TokenKind::NOT_EQUALS;
}

bool is_relation(linescript::TokenKind token) {
    return token == linescript::TokenKind::LT || token == linescript::TokenKind::GT;
}

bool is_additive(linescript::TokenKind token) {
    return token == linescript::TokenKind::PLUS || token == linescript::TokenKind::MINUS;
}

bool is_multiplicative(linescript::TokenKind token) {
    return token == linescript::TokenKind::STAR || token == linescript::TokenKind::SLASH;
}

// The whole text has to be a number, so "1.2.3" fails here rather than
// being read as 1.2.
bool to_double(const std::string& str, double& value) {
    if (str.empty()) {
        return false;
    }

    char* end = nullptr;
    value = std::strtod(str.c_str(), &end);

    return end == str.c_str() + str.size();
}

}  // namespace

namespace linescript {

Parser::Parser(Lexer& lexer) : m_lex{lexer} {}

std::optional<Error> Parser::parse_statement(ASTPtr& ast) {
    LINESCRIPT_FORWARD(start());

    ASTPtr statement;

    switch (cur_tok()) {
        case TokenKind::IDENT: {
            auto assign_ast = make_ast<AssignAST>();

            assign_ast->name = m_lex.token().str;
            LINESCRIPT_FORWARD(next_token());

            LINESCRIPT_FORWARD(eat_token(TokenKind::ASSIGN, "Expected '=' in assignment statement"));
            LINESCRIPT_FORWARD(parse_expr(assign_ast->expr));

            statement = std::move(assign_ast);
        } break;

        case TokenKind::PRINT: {
            auto print_ast = make_ast<PrintAST>();

            LINESCRIPT_FORWARD(next_token());
            LINESCRIPT_FORWARD(parse_expr(print_ast->expr));

            statement = std::move(print_ast);
        } break;

        default:
            return error("Expected assignment or print statement");
    }

    LINESCRIPT_FORWARD(eat_token(TokenKind::SEMI, "Expected ';' after statement"));

    ast = std::move(statement);

    return std::nullopt;
}

std::optional<Error> Parser::parse_expression(ASTPtr& ast) {
    LINESCRIPT_FORWARD(start());

    return parse_expr(ast);
}

std::optional<Error> Parser::at_end(bool& result) {
    LINESCRIPT_FORWARD(start());

    if (cur_tok() == TokenKind::SEMI) {
        LINESCRIPT_FORWARD(next_token());
    }

    result = cur_tok() == TokenKind::END;

    return std::nullopt;
}

TokenKind Parser::cur_tok() const { return m_lex.token().kind; }

std::optional<Error> Parser::start() {
    if (m_lex.started()) {
        return std::nullopt;
    }

    return next_token();
}

std::optional<Error> Parser::next_token() { return m_lex.next_token(); }

Error Parser::error(std::string message) const {
    return Error{ErrorKind::PARSE, m_lex.token().pos,
                 std::move(message) + " (found " + token_kind_name(cur_tok()) + ")"};
}

std::optional<Error> Parser::expect_token(TokenKind kind, const char* message) {
    if (cur_tok() != kind) {
        return error(message);
    }

    return std::nullopt;
}

std::optional<Error> Parser::eat_token(TokenKind kind, const char* message) {
    LINESCRIPT_FORWARD(expect_token(kind, message));

    return next_token();
}

std::optional<Error> Parser::parse_expr(ASTPtr& ast) {
    return parse_left_assoc<LogicalAST>(ast, &Parser::parse_logical_term, is_or);
}

std::optional<Error> Parser::parse_logical_term(ASTPtr& ast) {
    return parse_left_assoc<LogicalAST>(ast, &Parser::parse_logical_factor, is_and);
}

std::optional<Error> Parser::parse_logical_factor(ASTPtr& ast) {
    if (cur_tok() != TokenKind::NOT) {
        return parse_comparison(ast);
    }

    auto not_ast = make_ast<LogicalAST>();

    not_ast->op = TokenKind::NOT;
    LINESCRIPT_FORWARD(next_token());

    LINESCRIPT_FORWARD(parse_comparison(not_ast->lhs));

    ast = std::move(not_ast);

    return std::nullopt;
}

// The right operand of == and != is a full expression and not a relation,
// so "a == b and c" groups as "a == (b and c)".
std::optional<Error> Parser::parse_comparison(ASTPtr& ast) {
    ASTPtr lhs;
    LINESCRIPT_FORWARD(parse_relation(lhs));

    while (is_equality(cur_tok())) {
        auto cmp_ast = make_ast<CompareAST>();

        cmp_ast->op = cur_tok();
        LINESCRIPT_FORWARD(next_token());

        cmp_ast->lhs = std::move(lhs);
        LINESCRIPT_FORWARD(parse_expr(cmp_ast->rhs));

        lhs = std::move(cmp_ast);
    }

    ast = std::move(lhs);

    return std::nullopt;
}

std::optional<Error> Parser::parse_relation(ASTPtr& ast) {
    return parse_left_assoc<CompareAST>(ast, &Parser::parse_arithmetic, is_relation);
}

std::optional<Error> Parser::parse_arithmetic(ASTPtr& ast) {
    return parse_left_assoc<BinAST>(ast, &Parser::parse_term, is_additive);
}

std::optional<Error> Parser::parse_term(ASTPtr& ast) {
    return parse_left_assoc<BinAST>(ast, &Parser::parse_factor, is_multiplicative);
}

std::optional<Error> Parser::parse_factor(ASTPtr& ast) {
    if (!is_additive(cur_tok())) {
        return parse_primary(ast);
    }

    auto unary_ast = make_ast<UnaryAST>();

    unary_ast->op = cur_tok();
    LINESCRIPT_FORWARD(next_token());

    LINESCRIPT_FORWARD(parse_factor(unary_ast->operand));

    ast = std::move(unary_ast);

    return std::nullopt;
}

std::optional<Error> Parser::parse_primary(ASTPtr& ast) {
    switch (cur_tok()) {
        case TokenKind::NUMBER: {
            auto num_ast = make_ast<NumberAST>();

            if (!to_double(m_lex.token().str, num_ast->value)) {
                return error("Malformed number '" + m_lex.token().str + "'");
            }

            LINESCRIPT_FORWARD(next_token());

            ast = std::move(num_ast);
        } break;

        case TokenKind::BOOL: {
            auto bool_ast = make_ast<BoolAST>();

            bool_ast->value = m_lex.token().b_value;
            LINESCRIPT_FORWARD(next_token());

            ast = std::move(bool_ast);
        } break;

        case TokenKind::STRING: {
            auto str_ast = make_ast<StringAST>();

            str_ast->value = m_lex.token().str;
            LINESCRIPT_FORWARD(next_token());

            ast = std::move(str_ast);
        } break;

        case TokenKind::OPENPAREN: {
            LINESCRIPT_FORWARD(next_token());

            ASTPtr inner;
            LINESCRIPT_FORWARD(parse_expr(inner));

            LINESCRIPT_FORWARD(eat_token(TokenKind::CLOSEPAREN, "Mismatched parentheses"));

            ast = std::move(inner);
        } break;

        case TokenKind::IDENT: {
            auto var_ast = make_ast<VarAST>();

            var_ast->name = m_lex.token().str;
            LINESCRIPT_FORWARD(next_token());

            ast = std::move(var_ast);
        } break;

        default:
            return error("Expected expression");
    }

    return std::nullopt;
}

}  // namespace linescript
