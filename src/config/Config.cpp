#include "config/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

namespace thermo::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Leaves `out` untouched on anything but true/false
void parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") { out = true; return; }
    if (value == "false") { out = false; return; }
    util::Logger::warn("Config: Expected true/false for " + key + ", got '" + value + "'");
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg;

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        // Strip trailing comment unless it sits inside a quoted value
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            auto first_quote = line.find('"');
            auto last_quote = line.rfind('"');
            bool inside = first_quote != std::string::npos && first_quote < hash && hash < last_quote;
            if (!inside) line = line.substr(0, hash);
        }

        line = trim(line);
        if (line.empty()) continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line '" + line + "'");
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "printer") {
            if (key == "device") {
                cfg.device = std::filesystem::path(value);
            } else if (key == "code_page") {
                if (auto page = command::parse_code_page(value)) {
                    cfg.code_page = *page;
                } else {
                    util::Logger::warn("Config: Unknown code page '" + value + "'");
                }
            } else if (key == "initialize_on_open") {
                parse_bool(key, value, cfg.initialize_on_open);
            } else {
                util::Logger::warn("Config: Unknown key printer." + key);
            }
        } else if (current_section == "text") {
            if (key == "transliterate") {
                parse_bool(key, value, cfg.transliterate);
            } else {
                util::Logger::warn("Config: Unknown key text." + key);
            }
        } else if (current_section == "log") {
            if (key == "level") {
                if (!util::Logger::parse_level(value, cfg.log_level)) {
                    util::Logger::warn("Config: Unknown log level '" + value + "'");
                }
            } else if (key == "file") {
                cfg.log_file = std::filesystem::path(value);
            } else {
                util::Logger::warn("Config: Unknown key log." + key);
            }
        } else {
            util::Logger::warn("Config: Unknown section [" + current_section + "]");
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    std::string level = "info";
    switch (cfg.log_level) {
        case util::Logger::Level::Debug: level = "debug"; break;
        case util::Logger::Level::Info:  level = "info"; break;
        case util::Logger::Level::Warn:  level = "warn"; break;
        case util::Logger::Level::Error: level = "error"; break;
    }

    file << "# THERMO Config\n\n";

    file << "[printer]\n";
    file << "# Printer device node, or \"-\" for stdout\n";
    file << "device = \"" << cfg.device.string() << "\"\n";
    file << "# Code page selected after initialization (cp437, cp850, windows-1252, ...)\n";
    file << "code_page = \"" << command::code_page_name(cfg.code_page) << "\"\n";
    file << "# Send ESC @ before printing\n";
    file << "initialize_on_open = " << (cfg.initialize_on_open ? "true" : "false") << "\n\n";

    file << "[text]\n";
    file << "# Replace characters missing from the code page with ASCII lookalikes\n";
    file << "transliterate = " << (cfg.transliterate ? "true" : "false") << "\n\n";

    file << "[log]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "thermo" / "config.toml";
    }
    return ".config/thermo/config.toml";
}

}  // namespace thermo::config
