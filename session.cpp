#include "session.hpp"

#include <istream>
#include <ostream>

#include "ast.hpp"
#include "ast_printer.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace {

// Index of the first non whitespace character, or npos for a blank line.
std::size_t first_non_space(const std::string& line) {
    return line.find_first_not_of(" \t\r\n\f\v");
}

}  // namespace

namespace linescript {

Session::Session(std::ostream& out, std::ostream& err, Options options)
    : m_out{out}, m_err{err}, m_options{std::move(options)}, m_interpreter{out} {}

std::optional<Error> Session::run_line(const std::string& line) {
    ++m_line;

    const auto start = first_non_space(line);

    if (start == std::string::npos) {
        return std::nullopt;
    }

    // Comments never reach the lexer
    if (line.compare(start, 2, "//") == 0) {
        if (m_options.echo_comments) {
            m_out << "Comment: " << line.substr(start + 2) << '\n';
        }

        return std::nullopt;
    }

    Pos pos{m_line, 1, m_options.filename.empty() ? "<stdin>" : m_options.filename};

    auto statement_error = run_statement(line, pos);

    if (!statement_error || !m_options.expression_fallback) {
        return statement_error;
    }

    bool complete = false;
    auto expression_error = run_expression(line, pos, complete);

    if (!expression_error) {
        return std::nullopt;
    }

    return complete ? expression_error : statement_error;
}

std::size_t Session::run(std::istream& in) {
    std::size_t failures = 0;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        auto err = run_line(line);

        if (err) {
            m_err << err->what() << '\n';
            ++failures;
        }
    }

    return failures;
}

const VarStore& Session::store() const { return m_store; }

std::optional<Error> Session::run_statement(const std::string& line, const Pos& pos) {
    Lexer lexer{line, pos};
    Parser parser{lexer};

    ASTPtr ast;
    LINESCRIPT_FORWARD(parser.parse_statement(ast));

    if (m_options.dump_ast) {
        m_err << dump(*ast) << '\n';
    }

    // Print statements write their own output, the result is not shown.
    Value result;
    return m_interpreter.eval(*ast, m_store, result);
}

std::optional<Error> Session::run_expression(const std::string& line, const Pos& pos,
                                             bool& complete) {
    complete = false;

    Lexer lexer{line, pos};
    Parser parser{lexer};

    ASTPtr ast;
    LINESCRIPT_FORWARD(parser.parse_expression(ast));

    bool at_end = false;
    LINESCRIPT_FORWARD(parser.at_end(at_end));

    if (!at_end) {
        return Error{ErrorKind::PARSE, lexer.token().pos,
                     std::string{"Unexpected "} + token_kind_name(lexer.token().kind) +
                         " after expression"};
    }

    complete = true;

    if (m_options.dump_ast) {
        m_err << dump(*ast) << '\n';
    }

    Value result;
    LINESCRIPT_FORWARD(m_interpreter.eval(*ast, m_store, result));

    m_out << to_text(result) << '\n';

    return std::nullopt;
}

}  // namespace linescript
