/**
 * @file cli.hpp
 * @brief Main CLI class with REPL and generator ownership
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <timeuuid/core/generator.hpp>

#include "command_parser.hpp"
#include "config.hpp"
#include "output_formatter.hpp"

namespace timeuuid::cli {

/**
 * @brief Main CLI application class
 *
 * The generator is created on first use, so TRANSLATE and VALIDATE never
 * touch the state file.
 */
class Cli {
public:
    explicit Cli(CliConfig config = {});
    ~Cli();

    Cli(const Cli&) = delete;
    Cli& operator=(const Cli&) = delete;

    /**
     * @brief Run the interactive REPL loop
     * @return Exit code
     */
    int run();

    /**
     * @brief Execute a single command line
     * @return Command result code (-1 = quit)
     */
    int execute(const std::string& line);

    /**
     * @brief Execute a command given as separate arguments (argv style)
     * @return Exit code
     */
    int run_command(const std::vector<std::string>& tokens);

    /**
     * @brief The generator, constructed on first call
     * @throws core::NodeIdentityUnavailableError if no node id can be found
     */
    core::Generator& generator();

    bool has_generator() const { return generator_ != nullptr; }

    OutputFormatter& output() { return *output_; }
    CommandParser& parser() { return *parser_; }

    void request_quit();
    bool quit_requested() const { return quit_requested_; }

private:
    CliConfig config_;
    std::unique_ptr<CommandParser> parser_;
    std::unique_ptr<OutputFormatter> output_;
    std::unique_ptr<core::Generator> generator_;
    bool quit_requested_ = false;

    void register_commands();
    void print_banner();
    void print_prompt();
    int guarded(const std::function<int()>& body);
};

} // namespace timeuuid::cli
