#include "ast.hpp"

#include "ast_visitor.hpp"

namespace linescript {

std::optional<Error> NumberAST::visit(ASTVisitor& v) const { return v.visit(*this); }

std::optional<Error> BoolAST::visit(ASTVisitor& v) const { return v.visit(*this); }

std::optional<Error> StringAST::visit(ASTVisitor& v) const { return v.visit(*this); }

std::optional<Error> VarAST::visit(ASTVisitor& v) const { return v.visit(*this); }

std::optional<Error> AssignAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(expr->visit(v));

    return v.visit(*this);
}

std::optional<Error> PrintAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(expr->visit(v));

    return v.visit(*this);
}

std::optional<Error> UnaryAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(operand->visit(v));

    return v.visit(*this);
}

std::optional<Error> BinAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(v.pre_visit(*this));

    LINESCRIPT_FORWARD(lhs->visit(v));
    LINESCRIPT_FORWARD(rhs->visit(v));

    return v.visit(*this);
}

std::optional<Error> LogicalAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(lhs->visit(v));

    if (rhs) {
        LINESCRIPT_FORWARD(rhs->visit(v));
    }

    return v.visit(*this);
}

std::optional<Error> CompareAST::visit(ASTVisitor& v) const {
    LINESCRIPT_FORWARD(lhs->visit(v));
    LINESCRIPT_FORWARD(rhs->visit(v));

    return v.visit(*this);
}

}  // namespace linescript
