#include "error.hpp"

namespace linescript {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LEX:
            return "lex";
        case ErrorKind::PARSE:
            return "parse";
        case ErrorKind::EVAL:
            return "eval";
    }

    return "unknown";
}

std::string Error::what() const {
    return pos.filename + ":" + std::to_string(pos.line) + ":" + std::to_string(pos.column) +
           ": " + error_kind_name(kind) + " error: " + message;
}

}  // namespace linescript
