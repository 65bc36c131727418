#pragma once

#include "config/Config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace thermo::config {

// Options of the thermo command-line program
struct CommandLine {
    bool demo = false;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> device;
};

// Arguments after the program name. std::nullopt on an unknown flag or a
// flag missing its value.
std::optional<CommandLine> parse_command_line(const std::vector<std::string>& args);

// Config from --config (or the default file), with --device applied on top
Config resolve_config(const CommandLine& cmdline);

const char* usage();

}  // namespace thermo::config
