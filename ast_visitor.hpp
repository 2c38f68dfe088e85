#pragma once

#include <optional>

#include "error.hpp"

namespace linescript {

struct NumberAST;
struct BoolAST;
struct StringAST;
struct VarAST;
struct AssignAST;
struct PrintAST;
struct UnaryAST;
struct BinAST;
struct LogicalAST;
struct CompareAST;

// Every node kind must be handled, so there are no default implementations.
struct ASTVisitor {
    virtual ~ASTVisitor() = default;

    virtual std::optional<Error> visit(const NumberAST&) = 0;
    virtual std::optional<Error> visit(const BoolAST&) = 0;
    virtual std::optional<Error> visit(const StringAST&) = 0;
    virtual std::optional<Error> visit(const VarAST&) = 0;
    virtual std::optional<Error> visit(const AssignAST&) = 0;
    virtual std::optional<Error> visit(const PrintAST&) = 0;
    virtual std::optional<Error> visit(const UnaryAST&) = 0;
    virtual std::optional<Error> visit(const BinAST&) = 0;
    virtual std::optional<Error> visit(const LogicalAST&) = 0;
    virtual std::optional<Error> visit(const CompareAST&) = 0;

    // Called before the operands of a BinAST are visited
    virtual std::optional<Error> pre_visit(const BinAST&) { return std::nullopt; }
};

}  // namespace linescript
