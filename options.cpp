#include "options.hpp"

#include <string_view>

namespace linescript {

std::optional<std::string> parse_options(int argc, const char* const* argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--no-comments") {
            options.echo_comments = false;
        } else if (arg == "--no-fallback") {
            options.expression_fallback = false;
        } else if (arg == "--dump-ast") {
            options.dump_ast = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option " + std::string{arg};
        } else if (!options.filename.empty()) {
            return "Only one input file may be given";
        } else {
            options.filename = std::string{arg};
        }
    }

    return std::nullopt;
}

const char* usage() {
    return "usage: linescript [options] [file]\n"
           "\n"
           "Runs each line of file (or standard input) as a statement.\n"
           "\n"
           "options:\n"
           "  --no-comments  do not echo // comment lines\n"
           "  --no-fallback  do not retry failing lines as expressions\n"
           "  --dump-ast     write each parsed tree to standard error\n"
           "  -h, --help     show this message\n";
}

}  // namespace linescript
