#include "config/CommandLine.hpp"
#include "util/Logger.hpp"

namespace thermo::config {

std::optional<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmdline;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--demo") {
            cmdline.demo = true;
        } else if ((arg == "--config" || arg == "--device") && i + 1 < args.size()) {
            (arg == "--config" ? cmdline.config_path : cmdline.device) = args[++i];
        } else {
            util::Logger::warn("CommandLine: Rejected argument '" + arg + "'");
            return std::nullopt;
        }
    }
    return cmdline;
}

Config resolve_config(const CommandLine& cmdline) {
    Config cfg = cmdline.config_path
        ? ConfigLoader::load_from_file(*cmdline.config_path)
        : ConfigLoader::load_config();

    if (cmdline.device) {
        util::Logger::debug("CommandLine: Device overridden to " + cmdline.device->string());
        cfg.device = *cmdline.device;
    }
    return cfg;
}

const char* usage() {
    return "usage: thermo [--demo] [--config PATH] [--device PATH]\n"
           "  Prints stdin line by line, or a sample receipt with --demo.\n";
}

}  // namespace thermo::config
