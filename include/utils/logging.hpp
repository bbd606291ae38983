#pragma once

#include <atomic>
#include <string>

namespace voiceguard {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Accepts DEBUG, INFO, WARN/WARNING, ERROR (any case); unknown names map to INFO
    static LogLevel parseLevel(const std::string& name);

private:
    static void write(LogLevel level, const char* tag, const std::string& message);

    static std::atomic<bool> initialized_;
    static std::atomic<LogLevel> level_;
};

} // namespace utils
} // namespace voiceguard
