#pragma once

#include <memory>
#include <optional>
#include <string>

#include "error.hpp"
#include "pos.hpp"
#include "token_kind.hpp"

namespace linescript {

struct ASTVisitor;

// Nodes are built by the parser and never modified afterwards; everything
// downstream only sees them through ASTPtr.
struct AST {
    Pos pos;

    virtual ~AST() = default;

    // Visits the children first and then the node itself, stopping at the
    // first error returned by the visitor. BinAST also calls pre_visit
    // before its children.
    virtual std::optional<Error> visit(ASTVisitor&) const = 0;
};

using ASTPtr = std::unique_ptr<const AST>;

struct NumberAST final : AST {
    double value = 0;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

struct BoolAST final : AST {
    bool value = false;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

struct StringAST final : AST {
    std::string value;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

struct VarAST final : AST {
    std::string name;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

struct AssignAST final : AST {
    std::string name;
    ASTPtr expr;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

struct PrintAST final : AST {
    ASTPtr expr;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

// Prefix + or -
struct UnaryAST final : AST {
    TokenKind op;
    ASTPtr operand;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

// Arithmetic: + - * /
struct BinAST final : AST {
    TokenKind op;

    ASTPtr lhs;
    ASTPtr rhs;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

// and, or, and not. For not the operand is lhs and rhs is null.
struct LogicalAST final : AST {
    TokenKind op;

    ASTPtr lhs;
    ASTPtr rhs;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

// == != < >
struct CompareAST final : AST {
    TokenKind op;

    ASTPtr lhs;
    ASTPtr rhs;

    std::optional<Error> visit(ASTVisitor& v) const override;
};

}  // namespace linescript
