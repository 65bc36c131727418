#pragma once

#include <string>
#include <filesystem>

namespace thermo::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static constexpr const char* DEFAULT_LOG_FILE = "/tmp/thermo_debug.log";

    // Truncates `path`, then writes into it the lines logged before the
    // first init() (up to 256), so early warnings survive the switch
    static void init(const std::filesystem::path& path = DEFAULT_LOG_FILE);
    static void set_level(Level level);
    static Level level();

    // Accepts "debug", "info", "warn"/"warning", "error" (any case)
    static bool parse_level(const std::string& name, Level& out);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace thermo::util
