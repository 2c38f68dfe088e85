#pragma once

#include <string>

namespace linescript {

// Used to store the line, column and filename where an entity originated from
struct Pos {
    int line = 0;
    int column = 0;
    std::string filename;
};

}  // namespace linescript
