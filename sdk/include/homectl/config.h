// ─────────────────────────────────────────────────────────────────────────────
// homectl — Configuration (populated from YAML)
// ─────────────────────────────────────────────────────────────────────────────
//
// Every key is optional; a missing key keeps the default below.
//
//   loop:      { interval_s: 5.0 }
//   rules:     { thermostat_band_c: 1.0, lux_threshold: 200,
//                motion_brightness: 70, motion_timeout_s: 30.0 }
//   devices:   { initial_target_temperature: 24.0, initial_brightness: 50 }
//   sensors:   { seed: 0 }                       # 0 = random_device
//   sink:      { svg_path: "home_series.svg", csv_path: "" }
//   telemetry: { enable: false, endpoint: "ipc:///tmp/homectl/events" }
//   service:   { enable_watchdog: true, watchdog_interval_s: 5.0 }
//   log:       { level: info, file_path: "", max_file_bytes: 10485760,
//                max_rotated_files: 3 }
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/controller.h"
#include "homectl/logger.h"

#include <cstdint>
#include <string>

namespace homectl {

/// Where the recorded series goes at shutdown.
struct SinkConfig {
    /// SVG chart output (empty = disabled).
    std::string svg_path = "home_series.svg";

    /// CSV dump output (empty = disabled).
    std::string csv_path;
};

/// Device-change telemetry publisher.
struct TelemetryConfig {
    bool        enable   = false;
    std::string endpoint = "ipc:///tmp/homectl/events";
};

/// Service-manager integration.
struct ServiceConfig {
    /// Send WATCHDOG=1 keep-alives.
    bool   enable_watchdog     = true;

    /// Keep-alive period (s).  Should be < WatchdogSec/2 in the unit file.
    double watchdog_interval_s = 5.0;
};

/// Master configuration.
struct HomeConfig {
    ControllerConfig controller;
    uint32_t         sensor_seed = 0;
    SinkConfig       sink;
    TelemetryConfig  telemetry;
    ServiceConfig    service;
    LogConfig        log;
};

/// Load a HomeConfig from a YAML file.
/// Returns false and fills `error` on I/O, parse or validation failure.
bool loadConfig(const std::string& path, HomeConfig& config,
                std::string& error);

/// Same as loadConfig() but from an in-memory YAML document.
bool parseConfig(const std::string& yaml_text, HomeConfig& config,
                 std::string& error);

/// Range checks shared by the loaders and the CLI overrides.
bool validateConfig(const HomeConfig& config, std::string& error);

} // namespace homectl
