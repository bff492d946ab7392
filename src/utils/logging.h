#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace utils {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5,
};

// "trace" / "debug" / "info" / "warn" / "error" / "off" (case-insensitive).
// Unknown text -> fallback.
LogLevel parse_log_level(const std::string& s, LogLevel fallback = LogLevel::Info);

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl);
    LogLevel level() const;
    bool enabled(LogLevel lvl) const;

    // Mirrors every line to `path` (append mode) in addition to stderr.
    // An empty path turns the mirror off.
    bool set_log_file(const std::string& path);

    void log(LogLevel lvl, const std::string& msg);

private:
    Logger() = default;

    static const char* level_name_(LogLevel lvl);

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Warn;
    std::optional<std::ofstream> file_;
};

// Message expressions are only evaluated when the level is enabled,
// so hot paths (per-file filter evaluation) can log at TRACE cheaply.
#define SIFT_LOG_AT(lvl, msg)                                              \
    do {                                                                   \
        if (::utils::Logger::instance().enabled(lvl))                      \
            ::utils::Logger::instance().log(lvl, (msg));                   \
    } while (0)

#define LOG_TRACE(msg) SIFT_LOG_AT(::utils::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) SIFT_LOG_AT(::utils::LogLevel::Debug, msg)
#define LOG_INFO(msg)  SIFT_LOG_AT(::utils::LogLevel::Info,  msg)
#define LOG_WARN(msg)  SIFT_LOG_AT(::utils::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) SIFT_LOG_AT(::utils::LogLevel::Error, msg)

} // namespace utils
