#pragma once

#include <string>

namespace linescript {

struct AST;

// Renders a tree as an s-expression, e.g. "(+ 1 (* 2 3))". Two trees are
// structurally identical exactly when their dumps are equal.
std::string dump(const AST& ast);

}  // namespace linescript
