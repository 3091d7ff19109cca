/**
 * @file main.cpp
 * @brief timeuuid CLI entry point
 */

#include "cli.hpp"
#include "config.hpp"

#include <timeuuid/utils/logger.hpp>

#include <iostream>

namespace {

void print_version() {
    std::cout << "timeuuid-cli version 1.0.0\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto config = timeuuid::cli::parseArgs(argc, argv);

    if (config.help) {
        timeuuid::cli::printUsage(argv[0]);
        return 0;
    }
    if (config.error) {
        std::cerr << "Use --help for usage information.\n";
        return 1;
    }
    if (config.version) {
        print_version();
        return 0;
    }

    timeuuid::utils::Logger::instance().setLevel(timeuuid::cli::parseLogLevel(config.log_level));

    try {
        timeuuid::cli::Cli cli(config);

        if (!config.command.empty()) {
            return cli.run_command(config.command);
        }
        return cli.run();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
