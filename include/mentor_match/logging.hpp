#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace mentor_match::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    inline std::atomic<int>& minimumLevelStorage() {
        static std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
        return level;
    }

    inline void setMinimumLevel(LogLevel level) {
        minimumLevelStorage().store(static_cast<int>(level));
    }

    inline LogLevel minimumLevel() {
        return static_cast<LogLevel>(minimumLevelStorage().load());
    }

    inline const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default: return "?";
        }
    }

    inline std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%H:%M:%S");
        return oss.str();
    }

    /**
     * @brief Write a single log line
     *
     * DEBUG and INFO go to stdout, WARNING and ERROR to stderr. Lines are
     * serialized so strategies running on worker threads do not interleave.
     */
    inline void log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < minimumLevelStorage().load()) {
            return;
        }
        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);
        std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
        out << "[" << timestamp() << "] [" << levelTag(level) << "] " << message << std::endl;
    }

} // namespace mentor_match::logging

#define LOG_DEBUG(msg) ::mentor_match::logging::log(::mentor_match::logging::LogLevel::DEBUG, (msg))
#define LOG_INFO(msg) ::mentor_match::logging::log(::mentor_match::logging::LogLevel::INFO, (msg))
#define LOG_WARNING(msg) ::mentor_match::logging::log(::mentor_match::logging::LogLevel::WARNING, (msg))
#define LOG_ERROR(msg) ::mentor_match::logging::log(::mentor_match::logging::LogLevel::ERROR, (msg))
