// ─────────────────────────────────────────────────────────────────────────────
// homectld — command-line option unit tests
// ─────────────────────────────────────────────────────────────────────────────
//
// Tests cover:
//   1.  Number parsing (seed range, trailing junk, sign)
//   2.  Argument parsing and overrides
//   3.  Explicit overrides reach validateConfig()
//
// ─────────────────────────────────────────────────────────────────────────────

#include "cli_options.h"

#include <cassert>
#include <cstdio>
#include <string>

using namespace homectl;

// Evaluate expression even under NDEBUG.
#define VERIFY(expr)       do { bool _v = static_cast<bool>(expr); assert(_v); (void)_v; } while(0)
#define VERIFY_FALSE(expr) do { bool _v = static_cast<bool>(expr); assert(!_v); (void)_v; } while(0)

static int tests_run    = 0;
static int tests_passed = 0;

#define RUN_TEST(fn) do { \
    ++tests_run; \
    std::printf("  [%d] %-50s ", tests_run, #fn); \
    fn(); \
    ++tests_passed; \
    std::printf("OK\n"); \
} while(0)

template <int N>
static cli::ParseResult parse(const char* (&argv)[N], cli::Options& opts,
                              std::string& err) {
    return cli::parseArgs(N, argv, opts, err);
}

// ─── Numbers ────────────────────────────────────────────────────────────────

static void test_seed_range() {
    uint32_t v = 7;
    VERIFY(cli::parseUnsigned("0", v) && v == 0);
    VERIFY(cli::parseUnsigned("42", v) && v == 42);
    VERIFY(cli::parseUnsigned("4294967295", v) && v == 4294967295u);

    v = 7;
    VERIFY_FALSE(cli::parseUnsigned("4294967296", v));
    VERIFY_FALSE(cli::parseUnsigned("99999999999999999999999", v));
    VERIFY_FALSE(cli::parseUnsigned("-1", v));
    VERIFY_FALSE(cli::parseUnsigned("+3", v));
    VERIFY_FALSE(cli::parseUnsigned(" 3", v));
    VERIFY_FALSE(cli::parseUnsigned("3x", v));
    VERIFY_FALSE(cli::parseUnsigned("", v));
    VERIFY(v == 7);
}

static void test_interval_number() {
    double d = 0;
    VERIFY(cli::parseDouble("0.25", d) && d == 0.25);
    VERIFY(cli::parseDouble("0", d) && d == 0.0);
    VERIFY_FALSE(cli::parseDouble("", d));
    VERIFY_FALSE(cli::parseDouble("1s", d));
    VERIFY_FALSE(cli::parseDouble("1e999", d));
}

// ─── Arguments ──────────────────────────────────────────────────────────────

static void test_parse_all_options() {
    const char* argv[] = {"homectld", "-c", "/etc/homectl.yaml",
                          "--interval", "1.5", "--seed", "42"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(argv, opts, err) == cli::ParseResult::Run);
    VERIFY(opts.config_path == "/etc/homectl.yaml");
    VERIFY(opts.have_interval && opts.interval_s == 1.5);
    VERIFY(opts.have_seed && opts.seed == 42);

    HomeConfig cfg;
    cli::applyOverrides(opts, cfg);
    VERIFY(cfg.controller.interval_s == 1.5);
    VERIFY(cfg.sensor_seed == 42);
}

static void test_help_and_version() {
    const char* help[] = {"homectld", "--help"};
    const char* ver[]  = {"homectld", "-v"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(help, opts, err) == cli::ParseResult::Help);
    VERIFY(parse(ver, opts, err) == cli::ParseResult::Version);
}

static void test_negative_seed_rejected() {
    const char* argv[] = {"homectld", "--seed", "-1"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(argv, opts, err) == cli::ParseResult::Error);
    VERIFY(err == "Invalid seed: -1");
    VERIFY_FALSE(opts.have_seed);
}

static void test_unknown_and_missing_value() {
    cli::Options opts;
    std::string err;

    const char* unknown[] = {"homectld", "--fast"};
    VERIFY(parse(unknown, opts, err) == cli::ParseResult::Error);
    VERIFY(err == "Unknown option: --fast");

    const char* dangling[] = {"homectld", "--interval"};
    VERIFY(parse(dangling, opts, err) == cli::ParseResult::Error);
    VERIFY(err == "Unknown option: --interval");
}

// ─── Overrides and validation ───────────────────────────────────────────────

static void test_zero_interval_is_rejected() {
    const char* argv[] = {"homectld", "--interval", "0"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(argv, opts, err) == cli::ParseResult::Run);
    VERIFY(opts.have_interval);

    HomeConfig cfg;
    cli::applyOverrides(opts, cfg);
    VERIFY(cfg.controller.interval_s == 0.0);
    VERIFY_FALSE(validateConfig(cfg, err));
    VERIFY(err.find("interval_s") != std::string::npos);
}

static void test_huge_interval_is_rejected() {
    const char* argv[] = {"homectld", "-i", "1e11"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(argv, opts, err) == cli::ParseResult::Run);

    HomeConfig cfg;
    cli::applyOverrides(opts, cfg);
    VERIFY_FALSE(validateConfig(cfg, err));
}

static void test_absent_overrides_keep_config() {
    const char* argv[] = {"homectld"};
    cli::Options opts;
    std::string err;
    VERIFY(parse(argv, opts, err) == cli::ParseResult::Run);

    HomeConfig cfg;
    cfg.controller.interval_s = 2.0;
    cfg.sensor_seed = 9;
    cli::applyOverrides(opts, cfg);
    VERIFY(cfg.controller.interval_s == 2.0);
    VERIFY(cfg.sensor_seed == 9);
}

// ─── Main ───────────────────────────────────────────────────────────────────

int main() {
    std::printf("homectld CLI Option Tests\n");
    std::printf("=========================\n");

    RUN_TEST(test_seed_range);
    RUN_TEST(test_interval_number);
    RUN_TEST(test_parse_all_options);
    RUN_TEST(test_help_and_version);
    RUN_TEST(test_negative_seed_rejected);
    RUN_TEST(test_unknown_and_missing_value);
    RUN_TEST(test_zero_interval_is_rejected);
    RUN_TEST(test_huge_interval_is_rejected);
    RUN_TEST(test_absent_overrides_keep_config);

    std::printf("\n%d / %d tests passed.\n", tests_passed, tests_run);
    return (tests_passed == tests_run) ? 0 : 1;
}
