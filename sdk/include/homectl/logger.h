// ─────────────────────────────────────────────────────────────────────────────
// homectl — Logger (structured, levelled, file rotation)
// ─────────────────────────────────────────────────────────────────────────────
//
// Line format:
//   [2026-01-01 12:00:00.123] [INFO] [loop] message uptime_s=12.5
//
// Lines go to stderr and, when `file_path` is set, to a log file that is
// rotated by size (homectl.log → homectl.log.1 → …).  Safe to call from any
// thread.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace homectl {

enum class LogLevel : uint8_t {
    Emerg   = 0,
    Alert   = 1,
    Crit    = 2,
    Err     = 3,
    Warning = 4,
    Notice  = 5,
    Info    = 6,
    Debug   = 7,
};

inline const char* log_level_name(LogLevel l) noexcept {
    switch (l) {
        case LogLevel::Emerg:   return "EMERG";
        case LogLevel::Alert:   return "ALERT";
        case LogLevel::Crit:    return "CRIT";
        case LogLevel::Err:     return "ERR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Notice:  return "NOTICE";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Debug:   return "DEBUG";
    }
    return "UNKNOWN";
}

/// Parse "debug", "info", "warning", ... (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

struct LogConfig {
    /// Minimum log level.
    LogLevel    level             = LogLevel::Info;

    /// Optional log file path (empty = stderr only).
    std::string file_path;

    /// Maximum log file size before rotation (bytes, 0 = no rotation).
    size_t      max_file_bytes    = 10 * 1024 * 1024;

    /// Number of rotated files to keep.
    int         max_rotated_files = 3;

    /// Mirror lines to stderr.
    bool        to_stderr         = true;
};

class Logger {
public:
    explicit Logger(LogConfig cfg = {});

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const char* module, const std::string& msg);

    void error(const char* module, const std::string& msg)   { log(LogLevel::Err, module, msg); }
    void warning(const char* module, const std::string& msg) { log(LogLevel::Warning, module, msg); }
    void info(const char* module, const std::string& msg)    { log(LogLevel::Info, module, msg); }
    void debug(const char* module, const std::string& msg)   { log(LogLevel::Debug, module, msg); }

    /// Open the configured log file.  Returns false if it cannot be opened.
    bool openFile();

    void setLevel(LogLevel level) {
        level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) <= level_.load(std::memory_order_relaxed);
    }

    /// Number of lines emitted since construction.
    [[nodiscard]] uint64_t linesWritten() const noexcept {
        return lines_.load(std::memory_order_relaxed);
    }

private:
    void maybeRotate();

    using clock_t = std::chrono::steady_clock;

    LogConfig             cfg_;
    std::atomic<uint8_t>  level_;
    clock_t::time_point   start_time_;
    std::mutex            mu_;
    std::ofstream         log_file_;
    size_t                written_bytes_{0};
    std::atomic<uint64_t> lines_{0};
};

} // namespace homectl
