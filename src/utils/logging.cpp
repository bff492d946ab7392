#include "logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <thread>

namespace utils {

namespace {

// "YYYY-MM-DD HH:MM:SS.mmm", local time
std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", (int)ms);
    return buf;
}

std::string current_thread_id() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

} // namespace

LogLevel parse_log_level(const std::string& s, LogLevel fallback) {
    std::string v = s;
    for (char& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info")  return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "none") return LogLevel::Off;
    return fallback;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(LogLevel lvl) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = lvl;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Logger::enabled(LogLevel lvl) const {
    std::lock_guard<std::mutex> lock(mu_);
    return lvl != LogLevel::Off && (int)lvl >= (int)level_;
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (path.empty()) {
        file_.reset();
        return true;
    }
    std::ofstream ofs(path, std::ios::out | std::ios::app);
    if (!ofs.is_open()) return false;
    file_.emplace(std::move(ofs));
    return true;
}

const char* Logger::level_name_(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO";
    }
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mu_);
    if (lvl == LogLevel::Off || (int)lvl < (int)level_) return;

    std::string line =
        "[" + timestamp_now() + "]" +
        "[" + level_name_(lvl) + "]" +
        "[tid=" + current_thread_id() + "] " +
        msg;

    // stdout carries command output; diagnostics go to stderr
    std::cerr << line << "\n";

    if (file_.has_value()) {
        (*file_) << line << "\n";
        file_->flush();
    }
}

} // namespace utils
