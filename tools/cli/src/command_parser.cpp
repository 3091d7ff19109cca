/**
 * @file command_parser.cpp
 * @brief Command parsing implementation with case-insensitive matching
 */

#include "command_parser.hpp"
#include "cli.hpp"
#include "utils/string_utils.hpp"

#include <algorithm>

namespace timeuuid::cli {

// ParsedCommand implementation
bool ParsedCommand::has_flag(const std::string& flag) const {
    std::string normalized = utils::to_upper(flag);
    for (const auto& arg : args) {
        std::string upper = utils::to_upper(arg);
        if (upper == "-" + normalized || upper == "--" + normalized) {
            return true;
        }
    }
    return false;
}

std::string ParsedCommand::get_option(const std::string& name, const std::string& default_val) const {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "-" + name || args[i] == "--" + name) {
            return args[i + 1];
        }
    }
    return default_val;
}

std::vector<std::string> ParsedCommand::positional(const std::vector<std::string>& options_with_values) const {
    std::vector<std::string> result;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() > 1 && arg[0] == '-' && arg != "--") {
            std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
            if (std::find(options_with_values.begin(), options_with_values.end(), name) !=
                options_with_values.end()) {
                ++i;
            }
            continue;
        }
        result.push_back(arg);
    }
    return result;
}

// CommandParser implementation
CommandParser::CommandParser() {
    aliases_["Q"] = "QUIT";
    aliases_["EXIT"] = "QUIT";
    aliases_["?"] = "HELP";
    aliases_["H"] = "HELP";
    aliases_["GEN"] = "GENERATE";
    aliases_["TR"] = "TRANSLATE";
}

void CommandParser::register_command(const std::string& name, CommandInfo info) {
    std::string upper_name = utils::to_upper(name);
    info.name = upper_name;
    commands_[upper_name] = std::move(info);
}

void CommandParser::register_alias(const std::string& alias, const std::string& target) {
    aliases_[utils::to_upper(alias)] = utils::to_upper(target);
}

std::string CommandParser::resolve_alias(const std::string& name) const {
    std::string upper = utils::to_upper(name);
    auto it = aliases_.find(upper);
    return it != aliases_.end() ? it->second : upper;
}

ParsedCommand CommandParser::parse(const std::string& line) const {
    return parse(utils::tokenize(utils::trim(line)));
}

ParsedCommand CommandParser::parse(const std::vector<std::string>& tokens) const {
    ParsedCommand cmd;
    if (tokens.empty()) {
        return cmd;
    }

    cmd.command = resolve_alias(tokens[0]);

    size_t first_arg = 1;
    if (tokens.size() > 1) {
        if (const CommandInfo* info = get_command_info(cmd.command)) {
            std::string potential_sub = utils::to_upper(tokens[1]);
            if (std::find(info->subcommands.begin(), info->subcommands.end(), potential_sub) !=
                info->subcommands.end()) {
                cmd.subcommand = potential_sub;
                first_arg = 2;
            }
        }
    }

    cmd.args.assign(tokens.begin() + static_cast<std::ptrdiff_t>(std::min(first_arg, tokens.size())),
                    tokens.end());
    return cmd;
}

int CommandParser::execute(Cli& cli, const std::string& line) {
    return dispatch(cli, parse(line));
}

int CommandParser::execute(Cli& cli, const std::vector<std::string>& tokens) {
    return dispatch(cli, parse(tokens));
}

int CommandParser::dispatch(Cli& cli, const ParsedCommand& cmd) {
    if (cmd.command.empty()) {
        return 0;
    }

    auto it = commands_.find(cmd.command);
    if (it == commands_.end()) {
        cli.output().print_error("ERR unknown command '" + cmd.command + "', type HELP for available commands");
        return 1;
    }

    return it->second.handler(cli, cmd);
}

std::vector<std::string> CommandParser::get_commands() const {
    std::vector<std::string> result;
    result.reserve(commands_.size());
    for (const auto& [name, _] : commands_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const CommandInfo* CommandParser::get_command_info(const std::string& command) const {
    auto it = commands_.find(utils::to_upper(command));
    return it != commands_.end() ? &it->second : nullptr;
}

} // namespace timeuuid::cli
