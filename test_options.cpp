#include <cassert>
#include <string>

#include "options.hpp"

int main() {
    using namespace linescript;

    {
        const char* argv[] = {"linescript"};
        Options options;

        assert(!parse_options(1, argv, options));
        assert(options.filename.empty());
        assert(options.echo_comments);
        assert(options.expression_fallback);
        assert(!options.dump_ast);
        assert(!options.help);
    }

    {
        const char* argv[] = {"linescript", "--no-comments", "prog.ls", "--no-fallback",
                              "--dump-ast"};
        Options options;

        assert(!parse_options(5, argv, options));
        assert(options.filename == "prog.ls");
        assert(!options.echo_comments);
        assert(!options.expression_fallback);
        assert(options.dump_ast);
    }

    {
        const char* argv[] = {"linescript", "-h"};
        Options options;

        assert(!parse_options(2, argv, options));
        assert(options.help);
    }

    {
        const char* argv[] = {"linescript", "--verbose"};
        Options options;

        auto err = parse_options(2, argv, options);
        assert(err);
        assert(*err == "Unknown option --verbose");
    }

    {
        const char* argv[] = {"linescript", "a.ls", "b.ls"};
        Options options;

        assert(parse_options(3, argv, options));
    }

    return 0;
}
