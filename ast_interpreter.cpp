#include "ast_interpreter.hpp"

#include <functional>
#include <ostream>
#include <vector>

#include "ast.hpp"
#include "ast_visitor.hpp"

namespace {

using linescript::Error;
using linescript::ErrorKind;
using linescript::TokenKind;
using linescript::Value;

struct Evaluator final : linescript::ASTVisitor {
    Evaluator(linescript::VarStore& store, std::ostream& out) : m_store{store}, m_out{out} {}

    std::optional<Error> visit(const linescript::NumberAST& ast) override {
        m_values.emplace_back(ast.value);
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::BoolAST& ast) override {
        m_values.emplace_back(ast.value);
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::StringAST& ast) override {
        m_values.emplace_back(ast.value);
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::VarAST& ast) override {
        Value value;
        LINESCRIPT_FORWARD(m_store.get(ast.name, ast.pos, value));

        m_values.push_back(std::move(value));
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::AssignAST& ast) override {
        // The assigned value stays on the stack as the result
        m_store.set(ast.name, m_values.back());
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::PrintAST&) override {
        auto value = pop();

        m_out << linescript::to_text(value) << '\n';

        m_values.emplace_back();
        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::UnaryAST& ast) override {
        auto operand = pop();

        double d = 0;
        LINESCRIPT_FORWARD(number(ast, operand, d));

        m_values.emplace_back(ast.op == TokenKind::MINUS ? -d : d);
        return std::nullopt;
    }

    // A string literal with anything but + fails before the operands run.
    std::optional<Error> pre_visit(const linescript::BinAST& ast) override {
        const bool has_literal = is_string_literal(*ast.lhs) || is_string_literal(*ast.rhs);

        if (has_literal && ast.op != TokenKind::PLUS) {
            return Error{ErrorKind::EVAL, ast.pos,
                         std::string{"Can't use operator "} + linescript::token_kind_name(ast.op) +
                             " with strings"};
        }

        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::BinAST& ast) override {
        auto rhs_value = pop();
        auto lhs_value = pop();

        // String handling looks at what was written, not at what the operands
        // evaluated to: a variable holding text is treated like any other
        // operand and goes through numeric conversion.
        auto* lhs_str = dynamic_cast<const linescript::StringAST*>(ast.lhs.get());
        auto* rhs_str = dynamic_cast<const linescript::StringAST*>(ast.rhs.get());

        if (lhs_str || rhs_str) {
            if (lhs_str && rhs_str) {
                m_values.emplace_back(lhs_str->value + rhs_str->value);
            } else {
                m_values.emplace_back(linescript::to_text(lhs_value) +
                                      linescript::to_text(rhs_value));
            }

            return std::nullopt;
        }

        double a = 0;
        double b = 0;

        LINESCRIPT_FORWARD(number(ast, lhs_value, a));
        LINESCRIPT_FORWARD(number(ast, rhs_value, b));

        switch (ast.op) {
            case TokenKind::PLUS:
                m_values.emplace_back(std::plus<double>{}(a, b));
                break;
            case TokenKind::MINUS:
                m_values.emplace_back(std::minus<double>{}(a, b));
                break;
            case TokenKind::STAR:
                m_values.emplace_back(std::multiplies<double>{}(a, b));
                break;
            case TokenKind::SLASH:
                // Division by zero gives infinity or NaN
                m_values.emplace_back(std::divides<double>{}(a, b));
                break;
            default:
                return unexpected_operator(ast);
        }

        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::LogicalAST& ast) override {
        if (ast.op == TokenKind::NOT) {
            auto operand = pop();

            bool b = false;
            LINESCRIPT_FORWARD(boolean(ast, operand, b));

            m_values.emplace_back(!b);
            return std::nullopt;
        }

        auto rhs_value = pop();
        auto lhs_value = pop();

        bool a = false;
        bool b = false;

        LINESCRIPT_FORWARD(boolean(ast, lhs_value, a));
        LINESCRIPT_FORWARD(boolean(ast, rhs_value, b));

        switch (ast.op) {
            case TokenKind::AND:
                m_values.emplace_back(a && b);
                break;
            case TokenKind::OR:
                m_values.emplace_back(a || b);
                break;
            default:
                return unexpected_operator(ast);
        }

        return std::nullopt;
    }

    std::optional<Error> visit(const linescript::CompareAST& ast) override {
        auto rhs_value = pop();
        auto lhs_value = pop();

        if (lhs_value.is_text() && rhs_value.is_text()) {
            const auto& a = std::get<std::string>(lhs_value.v);
            const auto& b = std::get<std::string>(rhs_value.v);

            switch (ast.op) {
                case TokenKind::EQUALS:
                    m_values.emplace_back(a == b);
                    break;
                case TokenKind::NOT_EQUALS:
                    m_values.emplace_back(a != b);
                    break;
                default:
                    return Error{ErrorKind::EVAL, ast.pos,
                                 std::string{"Can't use operator "} +
                                     linescript::token_kind_name(ast.op) + " with strings"};
            }

            return std::nullopt;
        }

        if (lhs_value.is_text() || rhs_value.is_text()) {
            return Error{ErrorKind::EVAL, ast.pos,
                         std::string{"Can't compare "} + lhs_value.type_name() + " with " +
                             rhs_value.type_name()};
        }

        double a = 0;
        double b = 0;

        LINESCRIPT_FORWARD(number(ast, lhs_value, a));
        LINESCRIPT_FORWARD(number(ast, rhs_value, b));

        switch (ast.op) {
            case TokenKind::EQUALS:
                m_values.emplace_back(a == b);
                break;
            case TokenKind::NOT_EQUALS:
                m_values.emplace_back(a != b);
                break;
            case TokenKind::LT:
                m_values.emplace_back(a < b);
                break;
            case TokenKind::GT:
                m_values.emplace_back(a > b);
                break;
            default:
                return unexpected_operator(ast);
        }

        return std::nullopt;
    }

    Value last_value() const { return m_values.empty() ? Value{} : m_values.back(); }

private:
    linescript::VarStore& m_store;
    std::ostream& m_out;

    std::vector<Value> m_values;

    static bool is_string_literal(const linescript::AST& ast) {
        return dynamic_cast<const linescript::StringAST*>(&ast) != nullptr;
    }

    Value pop() {
        auto value = std::move(m_values.back());
        m_values.pop_back();
        return value;
    }

    static std::optional<Error> number(const linescript::AST& ast, const Value& value, double& d) {
        auto n = linescript::to_number(value);

        if (!n) {
            return Error{ErrorKind::EVAL, ast.pos,
                         std::string{"Cannot convert "} + value.type_name() + " '" +
                             linescript::to_text(value) + "' to a number"};
        }

        d = *n;
        return std::nullopt;
    }

    static std::optional<Error> boolean(const linescript::AST& ast, const Value& value, bool& b) {
        auto r = linescript::to_bool(value);

        if (!r) {
            return Error{ErrorKind::EVAL, ast.pos,
                         std::string{"Cannot convert "} + value.type_name() + " '" +
                             linescript::to_text(value) + "' to a boolean"};
        }

        b = *r;
        return std::nullopt;
    }

    template <typename T>
    static Error unexpected_operator(const T& ast) {
        return Error{ErrorKind::EVAL, ast.pos,
                     std::string{"Unexpected operator "} + linescript::token_kind_name(ast.op)};
    }
};

}  // namespace

namespace linescript {

ASTInterpreter::ASTInterpreter(std::ostream& out) : m_out{out} {}

std::optional<Error> ASTInterpreter::eval(const AST& ast, VarStore& store, Value& result) {
    Evaluator evaluator{store, m_out};

    LINESCRIPT_FORWARD(ast.visit(evaluator));

    result = evaluator.last_value();

    return std::nullopt;
}

}  // namespace linescript
