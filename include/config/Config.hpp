#pragma once

#include "command/CodePage.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <string>

namespace thermo::config {

struct Config {
    // [printer]
    std::filesystem::path device = "/dev/usb/lp0";  // "-" is stdout
    command::CodePage code_page = command::CodePage::Cp437;
    bool initialize_on_open = true;

    // [text]
    bool transliterate = true;

    // [log]
    util::Logger::Level log_level = util::Logger::Level::Info;
    std::filesystem::path log_file = util::Logger::DEFAULT_LOG_FILE;
};

class ConfigLoader {
public:
    // Reads get_config_file() if it exists, defaults otherwise
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
};

}  // namespace thermo::config
