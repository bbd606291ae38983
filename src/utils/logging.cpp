#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace voiceguard {
namespace utils {

namespace {

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

std::atomic<bool> Logger::initialized_{false};
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

void Logger::initialize(LogLevel level) {
    level_.store(level);
    if (!initialized_.exchange(true)) {
        debug("Logger initialized");
    }
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, "[DEBUG] ", message);
}

void Logger::setLevel(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::getLevel() {
    return level_.load();
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (upper == "WARN" || upper == "WARNING") {
        return LogLevel::WARN;
    } else if (upper == "ERROR") {
        return LogLevel::ERROR;
    }
    return LogLevel::INFO;
}

void Logger::write(LogLevel level, const char* tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(level_.load())) {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex());
    std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << timestamp() << " " << tag << message << std::endl;
}

} // namespace utils
} // namespace voiceguard
