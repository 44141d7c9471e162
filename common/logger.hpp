#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <atomic>
#include <optional>
#include <sstream>
#include <cstdlib>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// Accepts "debug", "info", "warn"/"warning", "error"/"err" in any case.
inline std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string s;
    for (char c : text) s += (char)((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    if (s == "debug")                  return LogLevel::DEBUG;
    if (s == "info")                   return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error" || s == "err")    return LogLevel::ERR;
    return std::nullopt;
}

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    // Mirror every emitted line into a file (appending). An empty path
    // stops mirroring. Returns false if the file could not be opened.
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    // ARKDROP_LOG_LEVEL and ARKDROP_LOG_FILE; unset variables leave the
    // current settings alone.
    void configure_from_env() {
        if (const char* lvl = std::getenv("ARKDROP_LOG_LEVEL")) {
            auto parsed = parse_log_level(lvl);
            if (parsed) {
                set_level(*parsed);
            } else {
                warn(std::string("ignoring unknown ARKDROP_LOG_LEVEL '") + lvl + "'");
            }
        }
        if (const char* path = std::getenv("ARKDROP_LOG_FILE")) {
            if (!set_log_file(path)) warn(std::string("cannot open log file ") + path);
        }
    }

    bool enabled(LogLevel lvl) const { return lvl >= level(); }

    void log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        (lvl >= LogLevel::WARN ? std::cerr : std::cout) << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) { configure_from_env(); }

    // "2024-05-01 12:00:00.123 [INFO ] [t3] message"
    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] [t" << thread_tag() << "] " << msg;
        return ss.str();
    }

    // Small per-thread number, stable for the thread's lifetime, so the
    // interleaved lines of parallel file tasks can be told apart.
    static u32 thread_tag() {
        static std::atomic<u32> next{0};
        thread_local u32 tag = next++;
        return tag;
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    mutable std::mutex mutex_;
    LogLevel      level_;
    std::ofstream file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
