#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <sstream>
#include <format>
#include <vector>

namespace thermo::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between writes
static std::filesystem::path log_path = Logger::DEFAULT_LOG_FILE;
static std::atomic<Logger::Level> min_level{Logger::Level::Info};

// Lines written before init(), replayed into the file it opens
static constexpr size_t MAX_EARLY_LINES = 256;
static std::vector<std::string> early_lines;
static bool initialized = false;

void Logger::init(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);

    for (const auto& line : early_lines) {
        log_file << line;
    }
    log_file.flush();
    early_lines.clear();
    initialized = true;
}

void Logger::set_level(Level level) {
    min_level.store(level);
}

Logger::Level Logger::level() {
    return min_level.load();
}

bool Logger::parse_level(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") { out = Level::Debug; return true; }
    if (lower == "info") { out = Level::Info; return true; }
    if (lower == "warn" || lower == "warning") { out = Level::Warn; return true; }
    if (lower == "error") { out = Level::Error; return true; }
    return false;
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Not initialized: append to whatever path is current
        log_file.open(log_path, std::ios::app);
    }

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    std::ostringstream stamp;
    stamp << std::put_time(&tm, "[%H:%M:%S] ");
    std::string line = stamp.str() + std::format("{}{}\n", level_str, message);

    if (!initialized && early_lines.size() < MAX_EARLY_LINES) {
        early_lines.push_back(line);
    }
    if (!log_file) return;

    log_file << line;
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace thermo::util
