// ─────────────────────────────────────────────────────────────────────────────
// homectl — Public API: HomeController (control loop)
// ─────────────────────────────────────────────────────────────────────────────
//
// Owns the devices, the sensors and the recorder, and drives the tick:
//
//   1. read every sensor
//   2. elapsed = now − start_time
//   3. append one row to the recorder
//   4. thermostat rule, then lighting rule
//   5. sleep for the interval (woken early by stop())
//
// State machine: Stopped (initial) ⇄ Running.  `start()` blocks the calling
// thread for the whole run; the lifecycle coordinator calls `begin()` on the
// foreground thread and `run_loop()` on a worker so that a stop issued right
// after launch is never lost.  `stop()` is idempotent and may be called from
// any thread.  It never interrupts a tick in progress, and no sensor is
// read after it returns on the loop side.
//
// All device, sensor and rule state is touched only from the loop thread.
//
// Usage:
//   auto src = std::make_shared<homectl::RandomValueSource>();
//   homectl::Logger log;
//   homectl::HomeController home({}, src, nullptr, log);
//   std::thread t([&] { home.start(5.0); });
//   // ...
//   home.stop();
//   t.join();
//   auto rows = home.export_series();
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/clock.h"
#include "homectl/device.h"
#include "homectl/logger.h"
#include "homectl/recorder.h"
#include "homectl/rule_engine.h"
#include "homectl/sensor.h"
#include "homectl/types.h"
#include "homectl/value_source.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace homectl {

// Identifiers of the default inventory.
inline constexpr const char* kLightId             = "light_1";
inline constexpr const char* kThermostatId        = "thermostat_1";
inline constexpr const char* kTemperatureSensorId = "temp_sensor_1";
inline constexpr const char* kLightSensorId       = "light_sensor_1";
inline constexpr const char* kMotionSensorId      = "motion_sensor_1";

/// Longest accepted tick interval (one day).
inline constexpr double kMaxIntervalSeconds = 86400.0;

/// True for a finite interval in (0, kMaxIntervalSeconds].  Rejects NaN.
inline constexpr bool interval_in_range(double seconds) noexcept {
    return seconds > 0.0 && seconds <= kMaxIntervalSeconds;
}

/// Configuration handed to HomeController at construction.
struct ControllerConfig {
    /// Seconds between ticks.
    double interval_s = 5.0;

    /// Rule thresholds.
    RuleConfig rules;

    /// Initial tunables of the default devices.
    int    initial_brightness         = kDefaultBrightness;
    double initial_target_temperature = kDefaultTargetTemperature;
};

class HomeController {
public:
    /// `clock` may be null (SteadyClock is used).
    HomeController(ControllerConfig config,
                   std::shared_ptr<IValueSource> source,
                   std::shared_ptr<IClock> clock,
                   Logger& log);
    ~HomeController();

    HomeController(const HomeController&) = delete;
    HomeController& operator=(const HomeController&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Stopped → Running, then tick until stop().  Blocks the caller.
    Status start(double interval_s);
    Status start() { return start(config_.interval_s); }

    /// Stopped → Running without ticking; re-bases start_time.
    Status begin();

    /// Tick every `interval_s` while Running.  Returns NotRunning if
    /// begin() was not called.
    Status run_loop(double interval_s);

    /// Running → Stopped and wake the sleeping loop.  Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // ── Tick ────────────────────────────────────────────────────────────

    /// Run one poll → record → decide iteration on the calling thread.
    void tick();

    [[nodiscard]] uint64_t ticks() const noexcept {
        return ticks_.load(std::memory_order_relaxed);
    }

    // ── Inventory ───────────────────────────────────────────────────────

    Device*       device(const std::string& id);
    const Device* device(const std::string& id) const;
    const Sensor* sensor(const std::string& id) const;

    Device& light()      { return devices_.at(kLightId); }
    Device& thermostat() { return devices_.at(kThermostatId); }

    [[nodiscard]] std::vector<std::string> device_ids() const;
    [[nodiscard]] std::vector<std::string> sensor_ids() const;

    // ── Recorded series ─────────────────────────────────────────────────

    [[nodiscard]] std::vector<TimeSeriesRecord> export_series() const {
        return recorder_.export_series();
    }

    const TimeSeriesRecorder& recorder() const { return recorder_; }

    // ── Hooks / runtime tuning ──────────────────────────────────────────

    /// Extra observer for device changes (telemetry).  Set before start().
    void on_device_event(DeviceListener cb) { user_device_cb_ = std::move(cb); }

    /// Replace the rule thresholds; picked up at the start of the next tick.
    void update_rules(const RuleConfig& rules);

    [[nodiscard]] RuleConfig rules() const;

    [[nodiscard]] Timestamp start_time() const { return start_time_; }
    [[nodiscard]] Timestamp last_motion_time() const { return last_motion_time_; }

private:
    void initialize_components();
    void handle_device_event(const DeviceEvent& ev);
    void evaluate_thermostat(const Sensor& temp);
    void evaluate_lighting(const Sensor& lux, const Sensor& motion, Timestamp now);
    void apply_pending_rules();

    ControllerConfig                 config_;
    std::shared_ptr<IValueSource>    source_;
    std::shared_ptr<IClock>          clock_;
    Logger&                          log_;

    // Inventory (ordered maps keep the original poll order stable).
    std::map<std::string, Device>    devices_;
    std::vector<std::string>         sensor_order_;
    std::map<std::string, Sensor>    sensors_;
    TimeSeriesRecorder               recorder_;

    DeviceListener                   user_device_cb_;

    // State
    std::atomic<bool>                running_{false};
    std::atomic<uint64_t>            ticks_{0};
    Timestamp                        start_time_;
    Timestamp                        last_motion_time_;

    // Interruptible sleep
    std::mutex                       sleep_mu_;
    std::condition_variable          sleep_cv_;

    // Rules (active copy is loop-thread only; pending copy is shared)
    RuleConfig                       rules_;
    mutable std::mutex               rules_mu_;
    RuleConfig                       pending_rules_;
    bool                             rules_dirty_{false};
};

} // namespace homectl
