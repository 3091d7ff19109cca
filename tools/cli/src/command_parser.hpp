/**
 * @file command_parser.hpp
 * @brief Command parsing and dispatch for timeuuid-cli
 */

#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace timeuuid::cli {

class Cli;

/**
 * @brief Parsed command structure
 */
struct ParsedCommand {
    std::string command;           // Primary command (uppercase, aliases resolved)
    std::string subcommand;        // Subcommand (uppercase) if any
    std::vector<std::string> args; // Arguments (case-preserved)

    bool has_flag(const std::string& flag) const;
    std::string get_option(const std::string& name, const std::string& default_val = "") const;

    /**
     * @brief Arguments that are neither flags nor option values
     * @param options_with_values Option names that consume the next argument
     */
    std::vector<std::string> positional(const std::vector<std::string>& options_with_values = {}) const;
};

/**
 * @brief Command handler function type
 */
using CommandHandler = std::function<int(Cli&, const ParsedCommand&)>;

/**
 * @brief Command metadata
 */
struct CommandInfo {
    std::string name;
    std::string description;
    std::string usage;
    std::vector<std::string> subcommands;
    CommandHandler handler;
};

/**
 * @brief Command parser with case-insensitive matching
 */
class CommandParser {
public:
    CommandParser();

    /**
     * @brief Register a command handler
     * @param name Command name (stored as uppercase)
     * @param info Command metadata and handler
     */
    void register_command(const std::string& name, CommandInfo info);

    /**
     * @brief Register a command alias
     * @param alias Alias (e.g., "GEN")
     * @param target Target command (e.g., "GENERATE")
     */
    void register_alias(const std::string& alias, const std::string& target);

    /**
     * @brief Parse and execute a command line
     * @return Command exit code (0 = success, -1 = quit)
     */
    int execute(Cli& cli, const std::string& line);

    /**
     * @brief Parse and execute an already split command line
     */
    int execute(Cli& cli, const std::vector<std::string>& tokens);

    /**
     * @brief Parse a command line without executing
     */
    ParsedCommand parse(const std::string& line) const;

    /**
     * @brief Parse pre-split tokens without executing
     */
    ParsedCommand parse(const std::vector<std::string>& tokens) const;

    /**
     * @brief All registered command names, sorted
     */
    std::vector<std::string> get_commands() const;

    /**
     * @brief Command info, or nullptr if not registered
     */
    const CommandInfo* get_command_info(const std::string& command) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliases_;

    std::string resolve_alias(const std::string& name) const;
    int dispatch(Cli& cli, const ParsedCommand& cmd);
};

} // namespace timeuuid::cli
