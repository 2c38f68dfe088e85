#pragma once

#include <optional>
#include <type_traits>

#include "ast.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "token_kind.hpp"

namespace linescript {

// Recursive descent parser. Each entry point produces one tree and leaves the
// lexer positioned right after the input it consumed. There is no recovery:
// the first error aborts the parse and no tree is produced.
struct Parser {
    explicit Parser(Lexer& lexer);

    // identifier = expression ;
    // print expression ;
    std::optional<Error> parse_statement(ASTPtr& ast);

    // Does not require a trailing semicolon.
    std::optional<Error> parse_expression(ASTPtr& ast);

    // True if nothing but an optional semicolon is left on the line.
    std::optional<Error> at_end(bool& result);

private:
    Lexer& m_lex;

    TokenKind cur_tok() const;

    std::optional<Error> start();
    std::optional<Error> next_token();

    Error error(std::string message) const;

    // Returns an error if the current token is not equal to kind
    std::optional<Error> expect_token(TokenKind kind, const char* message);

    // Returns an error if the current token is not equal to the kind, or
    // consumes the token if it is
    std::optional<Error> eat_token(TokenKind kind, const char* message);

    std::optional<Error> parse_expr(ASTPtr& ast);
    std::optional<Error> parse_logical_term(ASTPtr& ast);
    std::optional<Error> parse_logical_factor(ASTPtr& ast);
    std::optional<Error> parse_comparison(ASTPtr& ast);
    std::optional<Error> parse_relation(ASTPtr& ast);
    std::optional<Error> parse_arithmetic(ASTPtr& ast);
    std::optional<Error> parse_term(ASTPtr& ast);
    std::optional<Error> parse_factor(ASTPtr& ast);
    std::optional<Error> parse_primary(ASTPtr& ast);

    template <typename T>
    std::unique_ptr<T> make_ast() {
        static_assert(std::is_base_of_v<AST, T>);

        auto ast = std::make_unique<T>();

        ast->pos = m_lex.token().pos;

        return ast;
    }

    // Builds lhs op rhs for one of the left associative binary levels.
    template <typename T, typename Operand, typename IsOp>
    std::optional<Error> parse_left_assoc(ASTPtr& ast, Operand operand, IsOp is_op) {
        ASTPtr lhs;
        LINESCRIPT_FORWARD((this->*operand)(lhs));

        while (is_op(cur_tok())) {
            auto op_ast = make_ast<T>();

            op_ast->op = cur_tok();
            LINESCRIPT_FORWARD(next_token());

            op_ast->lhs = std::move(lhs);
            LINESCRIPT_FORWARD((this->*operand)(op_ast->rhs));

            lhs = std::move(op_ast);
        }

        ast = std::move(lhs);

        return std::nullopt;
    }
};

}  // namespace linescript
