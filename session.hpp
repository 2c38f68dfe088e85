#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "ast_interpreter.hpp"
#include "error.hpp"
#include "options.hpp"
#include "pos.hpp"
#include "var_store.hpp"

namespace linescript {

// Runs a program line by line against one variable store. Program output
// (print statements, expression results, comments) goes to out, errors and
// tree dumps go to err.
struct Session {
    Session(std::ostream& out, std::ostream& err, Options options = {});

    // Runs one line. A line that fails as a statement is retried from
    // scratch as an expression unless that is disabled in the options.
    // Variables assigned by earlier lines are kept whatever the outcome.
    std::optional<Error> run_line(const std::string& line);

    // Runs every line of in, reporting errors as they happen. Returns the
    // number of lines that failed.
    std::size_t run(std::istream& in);

    const VarStore& store() const;

private:
    std::ostream& m_out;
    std::ostream& m_err;

    Options m_options;

    VarStore m_store;
    ASTInterpreter m_interpreter;

    int m_line = 0;

    std::optional<Error> run_statement(const std::string& line, const Pos& pos);

    // complete is set once the expression has been parsed up to the end of
    // the line, which is when its own errors are worth reporting.
    std::optional<Error> run_expression(const std::string& line, const Pos& pos, bool& complete);
};

}  // namespace linescript
