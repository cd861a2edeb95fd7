// tickbook-sim - scenario runner for the limit order hook
//
// Builds a token ledger, pool manager, limit order hook and router from a JSON
// config, seeds balances and pools, runs the configured steps and prints a
// JSON summary of every order bucket touched.

#include "simulator.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace tickbook;
using namespace tickbook::sim;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string log_level;       // overrides general.log_level when set
};

void print_usage(const char* prog) {
    std::cout << "tickbook scenario simulator\n\n"
              << "Usage: " << prog << " [options] <config.json>\n\n"
              << "Options:\n"
              << "  -l, --log-level <level>  debug, info, warn or error\n"
              << "  -v, --verbose            Same as --log-level debug\n"
              << "  -h, --help               Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.log_level = "debug";
        } else if (arg[0] != '-' && options.config_path.empty()) {
            options.config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }

    if (options.config_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    Config config;
    try {
        config = Config::from_file(options.config_path);
    } catch (const Error& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    Log log(parse_level(options.log_level.empty() ? config.general.log_level
                                                  : options.log_level));

    Simulator sim(config, log);
    try {
        sim.setup();
    } catch (const Error& e) {
        log.error(std::string("setup failed: ") + e.what());
        return 1;
    }

    json steps = sim.run_steps();
    std::cout << sim.summary(std::move(steps)).dump(2) << "\n";
    return 0;
}
