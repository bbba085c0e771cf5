// ============================================================================
// main.cpp — Entry point for the modebench harness
// ============================================================================
//
// Exit status:
//   0    benchmark complete (an advisory margin failure still exits 0)
//   1    fatal error: bad usage, setup, sandbox, measurement or aggregation
//   2    --enforce-margin and at least one margin check failed
//   130  interrupted by SIGINT/SIGTERM
//
// ============================================================================

#include "modebench/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        modebench::Options opts = modebench::parse_args(argc, argv);

        if (opts.help) {
            modebench::print_usage(argv[0]);
            return 0;
        }

        return modebench::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        modebench::print_usage(argv[0]);
        return 1;
    }
}
