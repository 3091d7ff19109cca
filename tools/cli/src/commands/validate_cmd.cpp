/**
 * @file validate_cmd.cpp
 * @brief VALIDATE command - report which format a value is in
 */

#include "../cli.hpp"
#include "../utils/string_utils.hpp"

#include <timeuuid/core/format_codec.hpp>

namespace timeuuid::cli::commands {

int validate_cmd(Cli& cli, const ParsedCommand& cmd) {
    auto& out = cli.output();
    auto args = cmd.positional({"format", "f"});

    if (args.size() != 1) {
        out.print_error("Usage: VALIDATE <value> [--format <format>]");
        return 1;
    }
    const std::string& value = args[0];

    std::string requested = cmd.get_option("format", cmd.get_option("f"));
    if (!requested.empty()) {
        core::Format format = core::formatFromString(utils::to_lower(requested));
        bool ok = core::validate(value, format);
        out.print_key_values({
            {"value", value},
            {"format", core::formatToString(format)},
            {"valid", ok ? "yes" : "no"},
        });
        return ok ? 0 : 1;
    }

    std::string matched;
    for (core::Format format : core::kAllFormats) {
        bool ok = format == core::Format::Teenie ? core::validateTeenie(value)
                                                 : core::validate(value, format);
        if (ok) {
            matched = core::formatToString(format);
            break;
        }
    }

    out.print_key_values({
        {"value", value},
        {"format", matched.empty() ? "none" : matched},
        {"valid", matched.empty() ? "no" : "yes"},
    });
    return matched.empty() ? 1 : 0;
}

} // namespace timeuuid::cli::commands
