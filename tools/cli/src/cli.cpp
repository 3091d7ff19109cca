/**
 * @file cli.cpp
 * @brief Main CLI implementation with REPL loop
 */

#include "cli.hpp"
#include "utils/string_utils.hpp"

#include <timeuuid/core/errors.hpp>
#include <timeuuid/utils/logger.hpp>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>

// Command handlers (defined in commands/*.cpp)
namespace timeuuid::cli::commands {
    int generate_cmd(Cli& cli, const ParsedCommand& cmd);
    int translate_cmd(Cli& cli, const ParsedCommand& cmd);
    int validate_cmd(Cli& cli, const ParsedCommand& cmd);
    int info_cmd(Cli& cli, const ParsedCommand& cmd);
}

namespace timeuuid::cli {

// Global CLI pointer for signal handler
static Cli* g_cli = nullptr;

static void signal_handler(int) {
    if (g_cli) {
        g_cli->request_quit();
    }
}

Cli::Cli(CliConfig config)
    : config_(std::move(config))
    , parser_(std::make_unique<CommandParser>())
    , output_(std::make_unique<OutputFormatter>(config_.json_mode))
{
    register_commands();
}

Cli::~Cli() {
    if (g_cli == this) {
        g_cli = nullptr;
    }
}

void Cli::register_commands() {
    parser_->register_command("GENERATE", {
        .name = "GENERATE",
        .description = "Generate time-based UUIDs",
        .usage = "GENERATE [default|compact|urn|teenie] [count]",
        .subcommands = {},
        .handler = commands::generate_cmd
    });

    parser_->register_command("TRANSLATE", {
        .name = "TRANSLATE",
        .description = "Convert a UUID from one format to another",
        .usage = "TRANSLATE <value> <from-format> <to-format>",
        .subcommands = {},
        .handler = commands::translate_cmd
    });

    parser_->register_command("VALIDATE", {
        .name = "VALIDATE",
        .description = "Check a value and report its format",
        .usage = "VALIDATE <value> [--format <format>]",
        .subcommands = {},
        .handler = commands::validate_cmd
    });

    parser_->register_command("INFO", {
        .name = "INFO",
        .description = "Show generator node, sequence and state file",
        .usage = "INFO",
        .subcommands = {},
        .handler = commands::info_cmd
    });

    parser_->register_command("HELP", {
        .name = "HELP",
        .description = "Show help for commands",
        .usage = "HELP [command]",
        .subcommands = {},
        .handler = [](Cli& cli, const ParsedCommand& cmd) -> int {
            auto& out = cli.output();

            if (!cmd.args.empty()) {
                const auto* info = cli.parser().get_command_info(cmd.args[0]);
                if (info) {
                    out.print_line(info->name + " - " + info->description);
                    out.print_line("Usage: " + info->usage);
                    return 0;
                }
                out.print_error("Unknown command: " + cmd.args[0]);
                return 1;
            }

            out.print_line("timeuuid CLI - Available Commands:");
            out.print_line("");
            for (const auto& name : cli.parser().get_commands()) {
                const auto* info = cli.parser().get_command_info(name);
                std::ostringstream line;
                line << "  " << std::left << std::setw(12) << name << info->description;
                out.print_line(line.str());
            }
            out.print_line("");
            out.print_line("Type HELP <command> for detailed help on a specific command.");
            return 0;
        }
    });

    parser_->register_command("QUIT", {
        .name = "QUIT",
        .description = "Exit the CLI",
        .usage = "QUIT",
        .subcommands = {},
        .handler = [](Cli& cli, const ParsedCommand&) -> int {
            cli.request_quit();
            return -1;
        }
    });
}

core::Generator& Cli::generator() {
    if (!generator_) {
        generator_ = std::make_unique<core::Generator>(toGeneratorOptions(config_));
        // The override only seeds a new state file; an existing record keeps its node.
        if (config_.node && (*config_.node & core::kNodeMask) != generator_->node()) {
            LOG_WARN("Cli", "--node {} ignored, state file {} already holds node {}",
                     core::formatNodeId(*config_.node), generator_->statePath(),
                     core::formatNodeId(generator_->node()));
        }
    }
    return *generator_;
}

void Cli::print_banner() {
    if (config_.json_mode) return;
    std::cout << "timeuuid CLI - Type HELP for commands\n\n";
}

void Cli::print_prompt() {
    if (config_.json_mode) return;
    std::cout << "timeuuid> ";
    std::cout.flush();
}

int Cli::guarded(const std::function<int()>& body) {
    try {
        return body();
    } catch (const core::UuidError& e) {
        output_->print_error(e.what());
    } catch (const std::exception& e) {
        output_->print_error(std::string("unexpected failure: ") + e.what());
    }
    return 1;
}

int Cli::run() {
    g_cli = this;
    std::signal(SIGINT, signal_handler);

    print_banner();

    std::string line;
    while (!quit_requested_ && std::getline(std::cin, line)) {
        line = utils::trim(line);
        if (!line.empty()) {
            execute(line);
        }
        if (!quit_requested_) {
            print_prompt();
        }
    }

    if (!config_.json_mode) {
        std::cout << "Bye!\n";
    }
    return 0;
}

int Cli::execute(const std::string& line) {
    return guarded([&] { return parser_->execute(*this, line); });
}

int Cli::run_command(const std::vector<std::string>& tokens) {
    int rc = guarded([&] { return parser_->execute(*this, tokens); });
    return rc < 0 ? 0 : rc;
}

void Cli::request_quit() {
    quit_requested_ = true;
}

} // namespace timeuuid::cli
