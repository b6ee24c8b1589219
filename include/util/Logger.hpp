#pragma once

#include <filesystem>
#include <string>

namespace strata::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& log_path);
    static void set_level(Level level);
    static void set_echo(bool echo_to_stderr);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn", "error"; unknown names map to Info and clear *ok
    static Level parse_level(const std::string& name, bool* ok = nullptr);
};

}  // namespace strata::util
