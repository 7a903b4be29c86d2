#pragma once

#include <filesystem>
#include <string>

namespace coda::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Messages below min_level are dropped.
    static void init(const std::filesystem::path& path, Level min_level = Level::Info);
    static void set_level(Level min_level);
    static Level parse_level(const std::string& name);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace coda::util
