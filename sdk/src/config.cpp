// ─────────────────────────────────────────────────────────────────────────────
// homectl — Config loader (yaml-cpp)
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/config.h"

#include <yaml-cpp/yaml.h>

namespace homectl {

namespace {

template <typename T>
void read_opt(const YAML::Node& parent, const char* key, T& out) {
    const YAML::Node n = parent[key];
    if (n && !n.IsNull()) out = n.as<T>();
}

bool apply(const YAML::Node& root, HomeConfig& cfg, std::string& error) {
    if (!root || root.IsNull()) return true;        // empty document
    if (!root.IsMap()) {
        error = "top-level YAML node must be a map";
        return false;
    }

    if (const auto loop = root["loop"]) {
        read_opt(loop, "interval_s", cfg.controller.interval_s);
    }

    if (const auto rules = root["rules"]) {
        read_opt(rules, "thermostat_band_c", cfg.controller.rules.thermostat_band_c);
        read_opt(rules, "lux_threshold",     cfg.controller.rules.lux_threshold);
        read_opt(rules, "motion_brightness", cfg.controller.rules.motion_brightness);
        read_opt(rules, "motion_timeout_s",  cfg.controller.rules.motion_timeout_s);
    }

    if (const auto dev = root["devices"]) {
        read_opt(dev, "initial_target_temperature",
                 cfg.controller.initial_target_temperature);
        read_opt(dev, "initial_brightness", cfg.controller.initial_brightness);
    }

    if (const auto sensors = root["sensors"]) {
        read_opt(sensors, "seed", cfg.sensor_seed);
    }

    if (const auto sink = root["sink"]) {
        read_opt(sink, "svg_path", cfg.sink.svg_path);
        read_opt(sink, "csv_path", cfg.sink.csv_path);
    }

    if (const auto tel = root["telemetry"]) {
        read_opt(tel, "enable",   cfg.telemetry.enable);
        read_opt(tel, "endpoint", cfg.telemetry.endpoint);
    }

    if (const auto svc = root["service"]) {
        read_opt(svc, "enable_watchdog",     cfg.service.enable_watchdog);
        read_opt(svc, "watchdog_interval_s", cfg.service.watchdog_interval_s);
    }

    if (const auto log = root["log"]) {
        std::string level;
        read_opt(log, "level", level);
        if (!level.empty() && !parse_log_level(level, cfg.log.level)) {
            error = "unknown log level: " + level;
            return false;
        }
        read_opt(log, "file_path",         cfg.log.file_path);
        read_opt(log, "max_file_bytes",    cfg.log.max_file_bytes);
        read_opt(log, "max_rotated_files", cfg.log.max_rotated_files);
    }

    return validateConfig(cfg, error);
}

} // anonymous namespace

bool validateConfig(const HomeConfig& cfg, std::string& error) {
    const auto& c = cfg.controller;

    if (!interval_in_range(c.interval_s)) {
        error = "loop.interval_s must be within (0, 86400]";
        return false;
    }
    if (c.rules.thermostat_band_c < 0.0) {
        error = "rules.thermostat_band_c must be >= 0";
        return false;
    }
    if (!brightness_in_range(c.rules.motion_brightness)) {
        error = "rules.motion_brightness must be within [0, 100]";
        return false;
    }
    if (c.rules.motion_timeout_s < 0.0) {
        error = "rules.motion_timeout_s must be >= 0";
        return false;
    }
    if (!brightness_in_range(c.initial_brightness)) {
        error = "devices.initial_brightness must be within [0, 100]";
        return false;
    }
    if (!target_temperature_in_range(c.initial_target_temperature)) {
        error = "devices.initial_target_temperature must be within [18, 30]";
        return false;
    }
    if (cfg.service.enable_watchdog &&
        !interval_in_range(cfg.service.watchdog_interval_s)) {
        error = "service.watchdog_interval_s must be within (0, 86400]";
        return false;
    }
    if (cfg.telemetry.enable && cfg.telemetry.endpoint.empty()) {
        error = "telemetry.endpoint must be set when telemetry is enabled";
        return false;
    }
    if (cfg.log.max_rotated_files < 1) {
        error = "log.max_rotated_files must be >= 1";
        return false;
    }
    return true;
}

bool loadConfig(const std::string& path, HomeConfig& config,
                std::string& error) {
    HomeConfig cfg;
    try {
        const YAML::Node root = YAML::LoadFile(path);
        if (!apply(root, cfg, error)) {
            error = path + ": " + error;
            return false;
        }
    } catch (const YAML::BadFile&) {
        error = "Cannot open config file: " + path;
        return false;
    } catch (const YAML::Exception& e) {
        error = path + ": " + e.what();
        return false;
    }
    config = cfg;
    return true;
}

bool parseConfig(const std::string& yaml_text, HomeConfig& config,
                 std::string& error) {
    HomeConfig cfg;
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (!apply(root, cfg, error)) return false;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
    config = cfg;
    return true;
}

} // namespace homectl
