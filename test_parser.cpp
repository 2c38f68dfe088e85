#include <cassert>
#include <string>

#include "ast.hpp"
#include "ast_printer.hpp"
#include "parser.hpp"

namespace {

std::string parse_expr(const std::string& src) {
    using namespace linescript;

    Lexer lexer{src, Pos{1, 1, "test"}};
    Parser parser{lexer};

    ASTPtr ast;
    auto err = parser.parse_expression(ast);

    assert(!err);
    assert(ast);

    return dump(*ast);
}

linescript::Error parse_statement_error(const std::string& src) {
    using namespace linescript;

    Lexer lexer{src, Pos{1, 1, "test"}};
    Parser parser{lexer};

    ASTPtr ast;
    auto err = parser.parse_statement(ast);

    assert(err);
    // Nothing is produced for a line that fails to parse
    assert(!ast);

    return *err;
}

}  // namespace

int main() {
    using namespace linescript;

    assert(parse_expr("1 + 2 * 3") == "(+ 1 (* 2 3))");
    assert(parse_expr("(1 + 2) * 3") == "(* (+ 1 2) 3)");
    assert(parse_expr("1 - 2 - 3") == "(- (- 1 2) 3)");
    assert(parse_expr("8 / 4 / 2") == "(/ (/ 8 4) 2)");
    assert(parse_expr("- -1") == "(neg -1)");
    assert(parse_expr("-(1)") == "(neg 1)");
    assert(parse_expr("+x") == "(pos x)");
    assert(parse_expr("\"a\" + true") == "(+ \"a\" true)");

    assert(parse_expr("a or b or c") == "(or (or a b) c)");
    assert(parse_expr("a or b and c") == "(or a (and b c))");
    assert(parse_expr("a & b | c") == "(or (and a b) c)");
    assert(parse_expr("!a or b") == "(or (not a) b)");
    assert(parse_expr("! a < b") == "(not (< a b))");

    assert(parse_expr("a < b > c") == "(> (< a b) c)");
    assert(parse_expr("1 + 2 < 4") == "(< (+ 1 2) 4)");

    // The right side of == and != takes a whole expression
    assert(parse_expr("a == b and c") == "(== a (and b c))");
    assert(parse_expr("a < b == c < d") == "(== (< a b) (< c d))");
    assert(parse_expr("a != b == c") == "(!= a (== b c))");

    {
        Lexer lexer{"x = 5 * 2; y", Pos{1, 1, "test"}};
        Parser parser{lexer};

        ASTPtr ast;
        assert(!parser.parse_statement(ast));

        auto* assign_ast = dynamic_cast<const AssignAST*>(ast.get());
        assert(assign_ast);
        assert(assign_ast->name == "x");
        assert(dynamic_cast<const BinAST*>(assign_ast->expr.get()));
        assert(dump(*ast) == "(= x (* 5 2))");

        // The lexer is left right after the semicolon
        assert(lexer.token().kind == TokenKind::IDENT);
        assert(lexer.token().str == "y");
    }

    {
        Lexer lexer{"print \"a\" + \"b\";", Pos{1, 1, "test"}};
        Parser parser{lexer};

        ASTPtr ast;
        assert(!parser.parse_statement(ast));

        auto* print_ast = dynamic_cast<const PrintAST*>(ast.get());
        assert(print_ast);

        auto* bin_ast = dynamic_cast<const BinAST*>(print_ast->expr.get());
        assert(bin_ast);
        assert(bin_ast->op == TokenKind::PLUS);
        assert(dynamic_cast<const StringAST*>(bin_ast->lhs.get()));
        assert(dynamic_cast<const StringAST*>(bin_ast->rhs.get()));

        assert(lexer.token().kind == TokenKind::END);
    }

    {
        auto err = parse_statement_error("x 5;");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Expected '='", 0) == 0);
        assert(err.pos.column == 3);
    }

    {
        auto err = parse_statement_error("print 1");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Expected ';'", 0) == 0);
    }

    {
        auto err = parse_statement_error("5;");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Expected assignment or print", 0) == 0);
    }

    {
        auto err = parse_statement_error("x = (1 + 2;");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Mismatched parentheses", 0) == 0);
    }

    {
        auto err = parse_statement_error("x = 1.2.3;");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Malformed number", 0) == 0);
    }

    {
        auto err = parse_statement_error("print \"abc;");
        assert(err.kind == ErrorKind::LEX);
    }

    {
        auto err = parse_statement_error("x = 1 +;");
        assert(err.kind == ErrorKind::PARSE);
        assert(err.message.rfind("Expected expression", 0) == 0);
    }

    {
        // Subtraction written without spaces lexes as a negative number
        auto err = parse_statement_error("x = y -1;");
        assert(err.kind == ErrorKind::PARSE);
    }

    {
        // An expression stops at the first token it cannot use
        Lexer lexer{"x 5;", Pos{1, 1, "test"}};
        Parser parser{lexer};

        ASTPtr ast;
        assert(!parser.parse_expression(ast));
        assert(dump(*ast) == "x");

        bool at_end = true;
        assert(!parser.at_end(at_end));
        assert(!at_end);
    }

    {
        Lexer lexer{"1 + 2 * 3;", Pos{1, 1, "test"}};
        Parser parser{lexer};

        ASTPtr ast;
        assert(!parser.parse_expression(ast));

        bool at_end = false;
        assert(!parser.at_end(at_end));
        assert(at_end);
    }

    {
        // Parsing the same line twice gives the same tree
        const std::string line = "x = !a == (b + -2.5) * \"s\" or c > 1;";

        std::string dumps[2];

        for (auto& d : dumps) {
            Lexer lexer{line, Pos{1, 1, "test"}};
            Parser parser{lexer};

            ASTPtr ast;
            assert(!parser.parse_statement(ast));

            d = dump(*ast);
        }

        assert(dumps[0] == dumps[1]);
        assert(dumps[0] == "(= x (not (== a (or (* (+ b -2.5) \"s\") (> c 1)))))");
    }

    return 0;
}
