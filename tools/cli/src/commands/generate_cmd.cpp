/**
 * @file generate_cmd.cpp
 * @brief GENERATE command - create new UUIDs
 */

#include "../cli.hpp"
#include "../utils/string_utils.hpp"

#include <vector>

namespace timeuuid::cli::commands {

namespace {
constexpr uint64_t kMaxCount = 100000;
}

int generate_cmd(Cli& cli, const ParsedCommand& cmd) {
    auto& out = cli.output();
    auto args = cmd.positional();

    if (args.size() > 2) {
        out.print_error("Usage: GENERATE [default|compact|urn|teenie] [count]");
        return 1;
    }

    // GENERATE 5 is shorthand for GENERATE default 5
    std::string format_name = "default";
    std::string count_text = "1";
    if (args.size() == 1) {
        if (utils::parse_unsigned(args[0])) {
            count_text = args[0];
        } else {
            format_name = args[0];
        }
    } else if (args.size() == 2) {
        format_name = args[0];
        count_text = args[1];
    }

    // Resolve the format before the generator is touched
    core::Format format = core::formatFromString(utils::to_lower(format_name));

    auto count = utils::parse_unsigned(count_text);
    if (!count || *count == 0 || *count > kMaxCount) {
        out.print_error("count must be between 1 and " + std::to_string(kMaxCount));
        return 1;
    }

    auto& generator = cli.generator();
    std::vector<std::string> ids;
    ids.reserve(static_cast<size_t>(*count));
    for (uint64_t i = 0; i < *count; ++i) {
        ids.push_back(generator.generate(format));
    }

    out.print_array(ids);
    return 0;
}

} // namespace timeuuid::cli::commands
