/**
 * @file config.hpp
 * @brief timeuuid-cli configuration and argument parsing
 */

#pragma once

#include <timeuuid/core/errors.hpp>
#include <timeuuid/core/generator.hpp>
#include <timeuuid/utils/logger.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace timeuuid::cli {

/**
 * @brief CLI configuration
 */
struct CliConfig {
    core::StateMode state_mode = core::StateMode::Default;
    std::string state_file;                 ///< Set by --state-file
    std::optional<uint64_t> node;           ///< Set by --node, overrides the hardware address
    std::string log_level = "WARN";
    bool json_mode = false;
    bool help = false;
    bool version = false;
    bool error = false;                     ///< An option could not be parsed

    std::vector<std::string> command;       ///< First non-option argument and everything after it
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "timeuuid - time-based UUID generator\n\n"
              << "Usage: " << program_name << " [OPTIONS] [COMMAND [ARGS...]]\n\n"
              << "Options:\n"
              << "  --state-file <path>   Sequence state file (default: " << core::StateStore::defaultPath() << ")\n"
              << "  --no-state-file       Keep the sequence in memory only\n"
              << "  --node <hex>          Node identifier, 12 hex digits, used when a new state\n"
              << "                        file is created (default: MAC address)\n"
              << "  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: WARN)\n"
              << "  --json                Output in JSON format\n"
              << "  --version             Show version information\n"
              << "  --help                Show this help message\n"
              << "\nCommands:\n"
              << "  GENERATE [format] [count]        Generate UUIDs (formats: default, compact, urn, teenie)\n"
              << "  TRANSLATE <value> <from> <to>    Convert a UUID between formats\n"
              << "  VALIDATE <value>                 Report which format a value is in\n"
              << "  INFO                             Show node, sequence and state file\n"
              << "\nWithout a command an interactive prompt is started.\n\n"
              << "Examples:\n"
              << "  " << program_name << " GENERATE\n"
              << "  " << program_name << " --no-state-file GENERATE teenie 10\n"
              << "  " << program_name << " TRANSLATE 01234567-abcd-8901-efab-234567890123 default teenie\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline CliConfig parseArgs(int argc, char* argv[]) {
    CliConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.help = true;
            return config;
        }
        if (arg == "--version") {
            config.version = true;
            return config;
        }
        if (arg == "--json") {
            config.json_mode = true;
            continue;
        }
        if (arg == "--no-state-file") {
            config.state_mode = core::StateMode::Disabled;
            continue;
        }

        if (arg.empty() || arg[0] != '-') {
            config.command.assign(argv + i, argv + argc);
            break;
        }

        // Options that require a value
        if (arg != "--state-file" && arg != "--node" && arg != "--log-level") {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.error = true;
            return config;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.error = true;
            return config;
        }

        std::string value = argv[++i];

        if (arg == "--state-file") {
            config.state_mode = core::StateMode::Path;
            config.state_file = value;
        } else if (arg == "--node") {
            try {
                config.node = core::parseNodeId(value);
            } catch (const core::InvalidInputError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                config.error = true;
                return config;
            }
        } else {
            config.log_level = value;
        }
    }

    return config;
}

/**
 * @brief Convert a log level name, falling back to WARN
 */
inline ::timeuuid::utils::LogLevel parseLogLevel(const std::string& level_str) {
    return ::timeuuid::utils::logLevelFromString(level_str, ::timeuuid::utils::LogLevel::WARN);
}

/**
 * @brief Generator options described by the configuration
 */
inline core::GeneratorOptions toGeneratorOptions(const CliConfig& config) {
    core::GeneratorOptions options;
    options.state_mode = config.state_mode;
    options.state_path = config.state_file;
    if (config.node) {
        options.node_identity = std::make_shared<core::FixedNodeIdentity>(*config.node);
    }
    return options;
}

} // namespace timeuuid::cli
