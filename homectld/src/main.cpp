// ─────────────────────────────────────────────────────────────────────────────
// homectld — home automation controller daemon
// ─────────────────────────────────────────────────────────────────────────────
//
// Usage:
//   homectld                              defaults, 5 s tick
//   homectld --config /etc/homectl/homectl.yaml
//   homectld --interval 1 --seed 42
//   homectld --help | --version
//
// Signal handling:
//   SIGTERM / SIGINT  → graceful shutdown (series is rendered on exit)
//   SIGHUP            → reload config (log level, rule thresholds)
//
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/homectl.h"
#include "cli_options.h"
#include "service_notify.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

// ─── Version info (from CMake) ──────────────────────────────────────────────
#ifndef HOMECTL_VERSION
#define HOMECTL_VERSION "0.1.0-dev"
#endif

// ─── Signal flags ───────────────────────────────────────────────────────────
// Handlers only touch lock-free atomics; the foreground loop acts on them.
static std::atomic<bool> g_shutdown_requested{false};
static std::atomic<bool> g_reload_requested{false};

extern "C" void handle_shutdown(int /*sig*/) {
    g_shutdown_requested.store(true, std::memory_order_release);
}

extern "C" void handle_reload(int /*sig*/) {
    g_reload_requested.store(true, std::memory_order_release);
}

// ─── CLI usage ──────────────────────────────────────────────────────────────

static void printUsage(const char* argv0) {
    std::cerr
        << "Usage: " << argv0 << " [OPTIONS]\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config <path>   YAML configuration file (default: built-in)\n"
        << "  -i, --interval <s>    Tick interval in seconds (overrides config)\n"
        << "  -s, --seed <n>        Sensor simulation seed (0 = random)\n"
        << "  -v, --version         Print version and exit\n"
        << "  -h, --help            Print this help and exit\n"
        << "\n"
        << "Signals:\n"
        << "  SIGTERM, SIGINT       Graceful shutdown, then render the series\n"
        << "  SIGHUP                Reload log level and rule thresholds\n"
        << std::endl;
}

// ─── Config reload ──────────────────────────────────────────────────────────

static void reloadConfig(const std::string& path,
                         homectl::LifecycleCoordinator& coord,
                         homectl::Logger& log) {
    if (path.empty()) {
        log.warning("daemon", "SIGHUP ignored: started without --config");
        return;
    }

    homectl::HomeConfig cfg;
    std::string error;
    if (!homectl::loadConfig(path, cfg, error)) {
        log.warning("daemon", "Config reload failed: " + error);
        return;
    }

    // Hot-reloadable: log level, rule thresholds.
    log.setLevel(cfg.log.level);
    coord.controller().update_rules(cfg.controller.rules);
    log.info("daemon", "Config reloaded");
}

// ─── Main ───────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    using namespace homectl;

    // ── Parse CLI args ──────────────────────────────────────────────────
    cli::Options opts;
    std::string error;
    switch (cli::parseArgs(argc, argv, opts, error)) {
        case cli::ParseResult::Help:
            printUsage(argv[0]);
            return 0;
        case cli::ParseResult::Version:
            std::cout << "homectld " << HOMECTL_VERSION << "\n";
            return 0;
        case cli::ParseResult::Error:
            std::cerr << error << "\n";
            printUsage(argv[0]);
            return 1;
        case cli::ParseResult::Run:
            break;
    }
    const std::string& config_path = opts.config_path;

    // ── Load configuration ──────────────────────────────────────────────
    HomeConfig config;
    if (!config_path.empty() && !loadConfig(config_path, config, error)) {
        std::cerr << "ERROR: " << error << "\n";
        return 1;
    }
    cli::applyOverrides(opts, config);
    if (!validateConfig(config, error)) {
        std::cerr << "ERROR: " << error << "\n";
        return 1;
    }

    Logger log(config.log);
    if (!log.openFile()) {
        log.warning("daemon", "Cannot open log file " + config.log.file_path +
                              ", logging to stderr only");
    }
    log.info("daemon", std::string("homectld ") + HOMECTL_VERSION + " starting");

    // ── Install signal handlers ─────────────────────────────────────────
    {
        struct sigaction sa{};
        sa.sa_handler = handle_shutdown;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        sigaction(SIGTERM, &sa, nullptr);
        sigaction(SIGINT, &sa, nullptr);

        struct sigaction sa_hup{};
        sa_hup.sa_handler = handle_reload;
        sigemptyset(&sa_hup.sa_mask);
        sa_hup.sa_flags = SA_RESTART;
        sigaction(SIGHUP, &sa_hup, nullptr);
    }

    // ── Telemetry (outlives the control loop) ───────────────────────────
    TelemetryPublisher telemetry;
    if (config.telemetry.enable) {
        if (telemetry.open(config.telemetry.endpoint)) {
            log.info("telemetry", "Publishing device events on " +
                                  config.telemetry.endpoint);
        } else {
            log.warning("telemetry", "Failed to open " +
                                     config.telemetry.endpoint +
                                     ", telemetry disabled");
        }
    }

    // ── Controller + sinks ──────────────────────────────────────────────
    auto source = std::make_shared<RandomValueSource>(config.sensor_seed);
    auto controller = std::make_unique<HomeController>(
        config.controller, source, nullptr, log);
    if (telemetry.is_open()) {
        controller->on_device_event([&telemetry](const DeviceEvent& ev) {
            telemetry.publish(ev);
        });
    }

    auto fanout = std::make_unique<FanoutSink>();
    if (!config.sink.svg_path.empty())
        fanout->add(std::make_unique<SvgChartSink>(config.sink.svg_path));
    if (!config.sink.csv_path.empty())
        fanout->add(std::make_unique<CsvSeriesSink>(config.sink.csv_path));
    std::unique_ptr<ISeriesSink> sink;
    if (!fanout->empty()) sink = std::move(fanout);

    LifecycleCoordinator coord(std::move(controller), std::move(sink), log);

    Status s = coord.start(config.controller.interval_s);
    if (s != Status::OK) {
        log.error("daemon", std::string("Failed to start control loop: ") +
                            status_string(s));
        return 1;
    }
    service::notifyReady();

    // ── Foreground wait ─────────────────────────────────────────────────
    using clock = std::chrono::steady_clock;
    const auto watchdog_period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(config.service.watchdog_interval_s));
    auto last_watchdog = clock::now();

    while (!coord.wait_for_shutdown(std::chrono::milliseconds(250))) {
        if (g_shutdown_requested.load(std::memory_order_acquire)) {
            coord.request_shutdown();
            continue;
        }
        if (g_reload_requested.exchange(false, std::memory_order_acq_rel)) {
            reloadConfig(config_path, coord, log);
        }
        if (config.service.enable_watchdog &&
            clock::now() - last_watchdog >= watchdog_period) {
            service::notifyWatchdog();
            service::notifyStatus(coord.controller().ticks());
            last_watchdog = clock::now();
        }
    }

    // ── Shutdown ────────────────────────────────────────────────────────
    service::notifyStopping();
    s = coord.stop();
    if (s != Status::OK) {
        log.warning("daemon", std::string("Series was not rendered: ") +
                              status_string(s));
    }

    log.info("daemon", "homectld exited cleanly");
    return 0;
}
