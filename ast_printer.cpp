#include "ast_printer.hpp"

#include <vector>

#include "ast.hpp"
#include "ast_visitor.hpp"
#include "value.hpp"

namespace {

using linescript::Error;

const char* op_str(linescript::TokenKind op) {
    using linescript::TokenKind;

    switch (op) {
        case TokenKind::PLUS:
            return "+";
        case TokenKind::MINUS:
            return "-";
        case TokenKind::STAR:
            return "*";
        case TokenKind::SLASH:
            return "/";
        case TokenKind::EQUALS:
            return "==";
        case TokenKind::NOT_EQUALS:
            return "!=";
        case TokenKind::LT:
            return "<";
        case TokenKind::GT:
            return ">";
        case TokenKind::AND:
            return "and";
        case TokenKind::OR:
            return "or";
        case TokenKind::NOT:
            return "not";
        default:
            return "?";
    }
}

struct Printer final : linescript::ASTVisitor {
    std::optional<Error> visit(const linescript::NumberAST& ast) override {
        m_parts.push_back(linescript::format_number(ast.value));
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::BoolAST& ast) override {
        m_parts.push_back(ast.value ? "true" : "false");
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::StringAST& ast) override {
        m_parts.push_back('"' + ast.value + '"');
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::VarAST& ast) override {
        m_parts.push_back(ast.name);
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::AssignAST& ast) override {
        return list("=", {ast.name, pop()});
    }

    std::optional<Error> visit(const linescript::PrintAST&) override {
        return list("print", {pop()});
    }

    std::optional<Error> visit(const linescript::UnaryAST& ast) override {
        return list(ast.op == linescript::TokenKind::MINUS ? "neg" : "pos", {pop()});
    }

    std::optional<Error> visit(const linescript::BinAST& ast) override { return binary(ast.op); }

    std::optional<Error> visit(const linescript::LogicalAST& ast) override {
        if (!ast.rhs) {
            return list(op_str(ast.op), {pop()});
        }

        return binary(ast.op);
    }

    std::optional<Error> visit(const linescript::CompareAST& ast) override {
        return binary(ast.op);
    }

    std::string result() const { return m_parts.empty() ? std::string{} : m_parts.back(); }

private:
    std::vector<std::string> m_parts;

    std::string pop() {
        auto part = std::move(m_parts.back());
        m_parts.pop_back();
        return part;
    }

    std::optional<Error> binary(linescript::TokenKind op) {
        auto rhs = pop();
        auto lhs = pop();

        return list(op_str(op), {std::move(lhs), std::move(rhs)});
    }

    std::optional<Error> list(const std::string& head, std::vector<std::string> args) {
        std::string str = "(" + head;

        for (auto& arg : args) {
            str += ' ';
            str += arg;
        }

        str += ')';

        m_parts.push_back(std::move(str));
        return std::nullopt;
    }
};

}  // namespace

namespace linescript {

std::string dump(const AST& ast) {
    Printer printer;

    // The printer never fails
    auto err = ast.visit(printer);

    return err ? err->what() : printer.result();
}

}  // namespace linescript
