#pragma once

#include <cstdint>
#include <string>

#include "pos.hpp"

// Returns the error produced by v from the enclosing function, if any.
#define LINESCRIPT_FORWARD(v) \
    do {                      \
        auto res = (v);       \
        if (res) {            \
            return res;       \
        }                     \
    } while (0)

namespace linescript {

enum class ErrorKind : std::uint8_t { LEX, PARSE, EVAL };

const char* error_kind_name(ErrorKind kind);

// Errors are values: every fallible operation returns std::optional<Error>
// and only the caller decides what a failure means for the current line.
struct Error {
    ErrorKind kind;
    Pos pos;
    std::string message;

    std::string what() const;
};

}  // namespace linescript
