#pragma once

#include <iosfwd>
#include <optional>

#include "error.hpp"
#include "value.hpp"
#include "var_store.hpp"

namespace linescript {

struct AST;

// Tree walking evaluator. The only output it produces is that of print
// statements, which is written to the stream given at construction.
struct ASTInterpreter {
    explicit ASTInterpreter(std::ostream& out);

    // On success result holds the value of the tree (nothing for print).
    // On failure neither result nor the store is modified.
    std::optional<Error> eval(const AST& ast, VarStore& store, Value& result);

private:
    std::ostream& m_out;
};

}  // namespace linescript
