// ─────────────────────────────────────────────────────────────────────────────
// homectl — Logger implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace homectl {

using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

// "[2026-01-01 12:00:00.123] [INFO] [loop] message uptime_s=12.500"
std::string format_line(system_clock::time_point wall, double uptime_s,
                        LogLevel level, const char* module,
                        const std::string& msg) {
    const std::time_t tt = system_clock::to_time_t(wall);
    const auto ms = duration_cast<milliseconds>(wall.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&tt, &utc);

    char stamp[48];
    const std::size_t n = std::strftime(stamp, sizeof(stamp), "[%Y-%m-%d %H:%M:%S", &utc);
    std::snprintf(stamp + n, sizeof(stamp) - n, ".%03d]", static_cast<int>(ms));

    char uptime[32];
    std::snprintf(uptime, sizeof(uptime), " uptime_s=%.3f", uptime_s);

    std::string line;
    line.reserve(msg.size() + 80);
    line += stamp;
    line += " [";
    line += log_level_name(level);
    line += "] [";
    line += module;
    line += "] ";
    line += msg;
    line += uptime;
    return line;
}

std::string rotated_name(const std::string& path, int index) {
    return path + "." + std::to_string(index);
}

// homectld.log.(keep-1) → .keep, …, homectld.log → .1.  The file that was
// .keep is overwritten, so at most `keep` rotated files remain.
void shift_rotated(const std::string& path, int keep) {
    std::error_code ec;
    for (int i = keep - 1; i >= 1; --i) {
        const std::string from = rotated_name(path, i);
        if (fs::exists(from, ec)) fs::rename(from, rotated_name(path, i + 1), ec);
    }
    fs::rename(path, rotated_name(path, 1), ec);
}

} // anonymous namespace

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "emerg")                     { out = LogLevel::Emerg;   return true; }
    if (s == "alert")                     { out = LogLevel::Alert;   return true; }
    if (s == "crit")                      { out = LogLevel::Crit;    return true; }
    if (s == "err" || s == "error")       { out = LogLevel::Err;     return true; }
    if (s == "warning" || s == "warn")    { out = LogLevel::Warning; return true; }
    if (s == "notice")                    { out = LogLevel::Notice;  return true; }
    if (s == "info")                      { out = LogLevel::Info;    return true; }
    if (s == "debug")                     { out = LogLevel::Debug;   return true; }
    return false;
}

Logger::Logger(LogConfig cfg)
    : cfg_(std::move(cfg))
    , level_(static_cast<uint8_t>(cfg_.level))
    , start_time_(clock_t::now()) {}

void Logger::log(LogLevel level, const char* module, const std::string& msg) {
    if (!enabled(level)) return;

    const double uptime_s =
        duration_cast<milliseconds>(clock_t::now() - start_time_).count() / 1000.0;
    const std::string line =
        format_line(system_clock::now(), uptime_s, level, module, msg);

    std::lock_guard<std::mutex> lk(mu_);
    if (cfg_.to_stderr) std::cerr << line << '\n';
    if (log_file_.is_open()) {
        log_file_ << line << '\n';
        log_file_.flush();
        written_bytes_ += line.size() + 1;
        if (cfg_.max_file_bytes != 0 && written_bytes_ >= cfg_.max_file_bytes)
            maybeRotate();
    }
    lines_.fetch_add(1, std::memory_order_relaxed);
}

bool Logger::openFile() {
    if (cfg_.file_path.empty()) return true;

    std::lock_guard<std::mutex> lk(mu_);
    log_file_.open(cfg_.file_path, std::ios::app);
    if (!log_file_.is_open()) return false;

    // Appending to an existing file counts toward the rotation limit.
    std::error_code ec;
    const auto existing = fs::file_size(cfg_.file_path, ec);
    written_bytes_ = ec ? 0 : static_cast<size_t>(existing);
    return true;
}

// Called with mu_ held.
void Logger::maybeRotate() {
    log_file_.close();
    shift_rotated(cfg_.file_path, std::max(cfg_.max_rotated_files, 1));
    written_bytes_ = 0;

    log_file_.open(cfg_.file_path, std::ios::trunc);
    if (!log_file_.is_open() && cfg_.to_stderr)
        std::cerr << "homectl: cannot reopen " << cfg_.file_path
                  << " after rotation, file logging stopped\n";
}

} // namespace homectl
