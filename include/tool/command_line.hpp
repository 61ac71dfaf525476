#pragma once

#include <string>
#include <vector>

namespace tracectx {

enum class CommandMode {
    USAGE,      // malformed invocation, print usage
    CONFIG,     // --config <file.toml>
    ARGUMENTS,  // <trace_id> <span_id> [trace_flags] [trace_state]
};

struct CommandLine {
    CommandMode mode = CommandMode::USAGE;
    std::string config_path;
    std::vector<std::string> args;  // positional arguments, program name excluded
};

/**
 * @brief Classify the tool's argv
 *
 * "--config" is only accepted as the first argument and must be followed by
 * exactly one path; any other count is a usage error rather than positional
 * input. Positional mode takes 2 to 4 arguments.
 */
[[nodiscard]] CommandLine parse_command_line(int argc, const char* const argv[]);

} // namespace tracectx
