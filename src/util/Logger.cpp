#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace strata::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_path = "/tmp/strata.log";
static Logger::Level min_level = Logger::Level::Info;
static bool echo_enabled = true;

void Logger::init(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    std::error_code ec;
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    log_file.open(log_path, std::ios::app);
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

void Logger::set_echo(bool echo_to_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);
    echo_enabled = echo_to_stderr;
}

Logger::Level Logger::parse_level(const std::string& name, bool* ok) {
    if (ok) *ok = true;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (ok) *ok = false;
    return Level::Info;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;

    if (!log_file.is_open()) {
        // Fallback: open if not initialized
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

    if (log_file) {
        log_file << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ");
        log_file << std::format("{}{}\n", level_str, message);
        log_file.flush();
    }

    if (echo_enabled && level >= Level::Warn) {
        std::cerr << std::format("strata: {}{}\n", level_str, message);
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace strata::util
