#pragma once

#include <optional>
#include <string>

namespace linescript {

struct Options {
    // Empty means standard input
    std::string filename;

    bool echo_comments = true;

    // Retry a line that fails as a statement as a bare expression and print
    // its value.
    bool expression_fallback = true;

    bool dump_ast = false;

    bool help = false;
};

// Returns a message describing the problem if the arguments are invalid.
std::optional<std::string> parse_options(int argc, const char* const* argv, Options& options);

const char* usage();

}  // namespace linescript
