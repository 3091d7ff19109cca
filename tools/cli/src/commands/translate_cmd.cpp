/**
 * @file translate_cmd.cpp
 * @brief TRANSLATE command - convert a UUID between formats
 */

#include "../cli.hpp"
#include "../utils/string_utils.hpp"

namespace timeuuid::cli::commands {

int translate_cmd(Cli& cli, const ParsedCommand& cmd) {
    auto& out = cli.output();
    auto args = cmd.positional();

    if (args.size() != 3) {
        out.print_error("Usage: TRANSLATE <value> <from-format> <to-format>");
        return 1;
    }

    out.print_bulk_string(core::Generator::translate(
        args[0], utils::to_lower(args[1]), utils::to_lower(args[2])));
    return 0;
}

} // namespace timeuuid::cli::commands
