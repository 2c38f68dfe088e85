#include <fstream>
#include <iostream>

#include "options.hpp"
#include "session.hpp"

int main(int argc, char** argv) {
    using namespace linescript;

    Options options;

    if (auto err = parse_options(argc, argv, options)) {
        std::cerr << *err << "\n\n" << usage();
        return 2;
    }

    if (options.help) {
        std::cout << usage();
        return 0;
    }

    Session session{std::cout, std::cerr, options};

    std::size_t failures = 0;

    if (options.filename.empty()) {
        failures = session.run(std::cin);
    } else {
        std::ifstream file{options.filename};

        if (!file) {
            std::cerr << "Failed to open " << options.filename << '\n';
            return 2;
        }

        failures = session.run(file);
    }

    return failures == 0 ? 0 : 1;
}
