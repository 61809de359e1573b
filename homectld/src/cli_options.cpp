// ─────────────────────────────────────────────────────────────────────────────
// homectld — command-line options
// ─────────────────────────────────────────────────────────────────────────────
#include "cli_options.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace homectl::cli {

bool parseDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || !end || *end != '\0') return false;
    out = v;
    return true;
}

bool parseUnsigned(const std::string& s, uint32_t& out) {
    // strtoull alone accepts "-1" and " 7".
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0') return false;
    if (v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

ParseResult parseArgs(int argc, const char* const argv[], Options& opts,
                      std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") return ParseResult::Help;
        if (arg == "-v" || arg == "--version") return ParseResult::Version;

        if ((arg == "-c" || arg == "--config") && has_value) {
            opts.config_path = argv[++i];
            continue;
        }
        if ((arg == "-i" || arg == "--interval") && has_value) {
            if (!parseDouble(argv[++i], opts.interval_s)) {
                error = std::string("Invalid interval: ") + argv[i];
                return ParseResult::Error;
            }
            opts.have_interval = true;
            continue;
        }
        if ((arg == "-s" || arg == "--seed") && has_value) {
            if (!parseUnsigned(argv[++i], opts.seed)) {
                error = std::string("Invalid seed: ") + argv[i];
                return ParseResult::Error;
            }
            opts.have_seed = true;
            continue;
        }

        error = "Unknown option: " + arg;
        return ParseResult::Error;
    }
    return ParseResult::Run;
}

void applyOverrides(const Options& opts, HomeConfig& config) {
    if (opts.have_interval) config.controller.interval_s = opts.interval_s;
    if (opts.have_seed)     config.sensor_seed = opts.seed;
}

} // namespace homectl::cli
