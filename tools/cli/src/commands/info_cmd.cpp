/**
 * @file info_cmd.cpp
 * @brief INFO command - show generator identity and state
 */

#include "../cli.hpp"

#include <timeuuid/core/node_identity.hpp>

namespace timeuuid::cli::commands {

int info_cmd(Cli& cli, const ParsedCommand&) {
    auto& out = cli.output();
    auto& generator = cli.generator();

    std::string state = generator.statePath();
    out.print_key_values({
        {"node", core::formatNodeId(generator.node())},
        {"sequence", std::to_string(generator.sequence())},
        {"state_file", state.empty() ? "(memory)" : state},
        {"summary", generator.describe()},
    });
    return 0;
}

} // namespace timeuuid::cli::commands
