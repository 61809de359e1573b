// ─────────────────────────────────────────────────────────────────────────────
// homectld — command-line options
// ─────────────────────────────────────────────────────────────────────────────
//
//   -c, --config <path>   YAML configuration file
//   -i, --interval <s>    tick interval override
//   -s, --seed <n>        sensor simulation seed override (0 .. 2^32-1)
//   -v, --version / -h, --help
//
// Overrides are only applied when given, so `--interval 0` reaches
// validateConfig() and is rejected there.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/config.h"

#include <cstdint>
#include <string>

namespace homectl::cli {

struct Options {
    std::string config_path;
    bool        have_interval = false;
    double      interval_s    = 0.0;
    bool        have_seed     = false;
    uint32_t    seed          = 0;
};

enum class ParseResult {
    Run,
    Help,
    Version,
    Error,
};

/// Whole string must be a number.
bool parseDouble(const std::string& s, double& out);

/// Decimal digits only, within uint32_t.
bool parseUnsigned(const std::string& s, uint32_t& out);

/// On Error, `error` names the offending argument.
ParseResult parseArgs(int argc, const char* const argv[], Options& opts,
                      std::string& error);

/// Copy the overrides that were given into `config`.
void applyOverrides(const Options& opts, HomeConfig& config);

} // namespace homectl::cli
