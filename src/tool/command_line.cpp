#include "tool/command_line.hpp"

#include <string_view>

namespace tracectx {

static constexpr std::string_view kConfigFlag = "--config";

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cmd;
    if (argc < 2) return cmd;

    if (std::string_view(argv[1]) == kConfigFlag) {
        if (argc == 3) {
            cmd.mode = CommandMode::CONFIG;
            cmd.config_path = argv[2];
        }
        return cmd;
    }

    if (argc >= 3 && argc <= 5) {
        cmd.mode = CommandMode::ARGUMENTS;
        cmd.args.assign(argv + 1, argv + argc);
    }
    return cmd;
}

} // namespace tracectx
