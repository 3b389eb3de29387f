// ============================================================================
// main.cpp — Entry point for the pdm tool
// ============================================================================

#include "pdm/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        pdm::Options opts = pdm::parse_args(argc, argv);

        if (opts.help) {
            pdm::print_usage(argv[0]);
            return 0;
        }

        return pdm::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        pdm::print_usage(argv[0]);
        return 1;
    }
}
