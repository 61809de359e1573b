// ─────────────────────────────────────────────────────────────────────────────
// homectl — HomeController implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/controller.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>

namespace homectl {

using namespace std::chrono;

namespace {

double round2(double v) { return std::round(v * 100.0) / 100.0; }

std::string fmt_celsius(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f°C", v);
    return buf;
}

} // anonymous namespace

// ─── Construction / destruction ─────────────────────────────────────────────

HomeController::HomeController(ControllerConfig config,
                               std::shared_ptr<IValueSource> source,
                               std::shared_ptr<IClock> clock,
                               Logger& log)
    : config_(std::move(config))
    , source_(std::move(source))
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>())
    , log_(log)
    , rules_(config_.rules)
    , pending_rules_(config_.rules)
{
    start_time_       = clock_->now();
    last_motion_time_ = start_time_;
    initialize_components();
}

HomeController::~HomeController() {
    stop();
}

void HomeController::initialize_components() {
    devices_.emplace(kLightId,
        Device::light(kLightId, "Living Room Light",
                      config_.initial_brightness));
    devices_.emplace(kThermostatId,
        Device::thermostat(kThermostatId, "Main Thermostat",
                           config_.initial_target_temperature));

    for (auto& entry : devices_) {
        entry.second.set_listener([this](const DeviceEvent& ev) {
            handle_device_event(ev);
        });
    }

    // Poll order: temperature, light, motion.
    const struct {
        const char* id;
        const char* name;
        SensorKind  kind;
    } sensors[] = {
        {kTemperatureSensorId, "Temperature Sensor", SensorKind::Temperature},
        {kLightSensorId,       "Light Sensor",       SensorKind::Light},
        {kMotionSensorId,      "Motion Sensor",      SensorKind::Motion},
    };
    for (const auto& s : sensors) {
        sensors_.emplace(s.id, Sensor(s.id, s.name, s.kind, source_));
        sensor_order_.emplace_back(s.id);
    }
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

Status HomeController::start(double interval_s) {
    if (!interval_in_range(interval_s)) return Status::InvalidParameter;

    Status s = begin();
    if (s != Status::OK) return s;
    return run_loop(interval_s);
}

Status HomeController::begin() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel))
        return Status::AlreadyRunning;

    start_time_ = clock_->now();
    log_.info("loop", "Starting Home Automation System...");
    return Status::OK;
}

Status HomeController::run_loop(double interval_s) {
    if (!interval_in_range(interval_s)) {
        stop();
        return Status::InvalidParameter;
    }
    if (!running()) return Status::NotRunning;

    const auto interval =
        duration_cast<nanoseconds>(duration<double>(interval_s));

    while (running()) {
        tick();

        std::unique_lock<std::mutex> lk(sleep_mu_);
        sleep_cv_.wait_for(lk, interval, [this] { return !running(); });
    }

    log_.info("loop", "Control loop exited after " +
                      std::to_string(ticks()) + " ticks");
    return Status::OK;
}

void HomeController::stop() {
    {
        std::lock_guard<std::mutex> lk(sleep_mu_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    }
    sleep_cv_.notify_all();
    log_.info("loop", "-- Stopping Home Automation System --");
}

// ─── Tick ───────────────────────────────────────────────────────────────────

void HomeController::tick() {
    apply_pending_rules();

    log_.debug("sensor", "--- Reading Sensor Data ---");

    bool read_ok[3] = {false, false, false};
    for (size_t i = 0; i < sensor_order_.size(); ++i) {
        Sensor& s = sensors_.at(sensor_order_[i]);
        const Status st = s.read_value();
        read_ok[i] = (st == Status::OK);
        if (read_ok[i]) {
            log_.debug("sensor", s.name() + ": " + s.value_string());
        } else {
            log_.error("sensor", s.name() + ": read failed (" +
                                 status_string(st) + ")");
        }
    }

    const Timestamp now = clock_->now();
    const double elapsed = round2((now - start_time_).to_seconds());

    const Sensor& temp   = sensors_.at(kTemperatureSensorId);
    const Sensor& lux    = sensors_.at(kLightSensorId);
    const Sensor& motion = sensors_.at(kMotionSensorId);

    recorder_.append(elapsed,
                     temp.temperature().value_or(
                         std::numeric_limits<double>::quiet_NaN()),
                     lux.lux().value_or(-1),
                     motion.motion().value_or(false) ? 1 : 0);
    ticks_.fetch_add(1, std::memory_order_relaxed);

    if (read_ok[0]) {
        evaluate_thermostat(temp);
    } else {
        log_.warning("rules", "Thermostat rule skipped: no temperature reading");
    }

    if (read_ok[1] && read_ok[2]) {
        evaluate_lighting(lux, motion, now);
    } else {
        log_.warning("rules", "Lighting rule skipped: missing light or motion reading");
    }
}

void HomeController::evaluate_thermostat(const Sensor& temp) {
    Device& thermostat = devices_.at(kThermostatId);
    const double current = *temp.temperature();
    const double target =
        thermostat.target_temperature().value_or(kDefaultTargetTemperature);

    const auto d = apply_thermostat_rule(thermostat, current, rules_);
    switch (d) {
        case ThermostatDecision::Cooling:
            log_.info("rules", "[Thermostat] Cooling needed. Current: " +
                               fmt_celsius(current) + ", Target: " +
                               fmt_celsius(target));
            break;
        case ThermostatDecision::Heating:
            log_.info("rules", "[Thermostat] Heating needed. Current: " +
                               fmt_celsius(current) + ", Target: " +
                               fmt_celsius(target));
            break;
        case ThermostatDecision::Stable:
            log_.info("rules", "[Thermostat] Temperature stable. Current: " +
                               fmt_celsius(current));
            break;
    }
}

void HomeController::evaluate_lighting(const Sensor& lux, const Sensor& motion,
                                       Timestamp now) {
    Device& light = devices_.at(kLightId);

    const auto action = apply_lighting_rule(light, *motion.motion(), *lux.lux(),
                                            now, last_motion_time_, rules_);
    if (action == LightingAction::TurnOff) {
        log_.info("rules", "No motion detected for " +
                           std::to_string(static_cast<int>(rules_.motion_timeout_s)) +
                           " seconds. Turning off light.");
    }
}

// ─── Device events ──────────────────────────────────────────────────────────

void HomeController::handle_device_event(const DeviceEvent& ev) {
    switch (ev.field) {
        case DeviceField::Status:
            log_.info("device", "[" + ev.name + "] Status changed to: " +
                                device_status_name(ev.status));
            break;
        case DeviceField::Brightness:
            log_.info("device", "[" + ev.name + "] Brightness set to " +
                                std::to_string(static_cast<int>(ev.value)) + "%");
            break;
        case DeviceField::TargetTemperature:
            log_.info("device", "[" + ev.name + "] Target temperature set to " +
                                fmt_celsius(ev.value));
            break;
    }
    if (user_device_cb_) user_device_cb_(ev);
}

// ─── Inventory ──────────────────────────────────────────────────────────────

Device* HomeController::device(const std::string& id) {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : &it->second;
}

const Device* HomeController::device(const std::string& id) const {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : &it->second;
}

const Sensor* HomeController::sensor(const std::string& id) const {
    auto it = sensors_.find(id);
    return it == sensors_.end() ? nullptr : &it->second;
}

std::vector<std::string> HomeController::device_ids() const {
    std::vector<std::string> ids;
    ids.reserve(devices_.size());
    for (const auto& [id, dev] : devices_) ids.push_back(id);
    return ids;
}

std::vector<std::string> HomeController::sensor_ids() const {
    return sensor_order_;
}

// ─── Rules ──────────────────────────────────────────────────────────────────

void HomeController::update_rules(const RuleConfig& rules) {
    std::lock_guard<std::mutex> lk(rules_mu_);
    pending_rules_ = rules;
    rules_dirty_   = true;
}

RuleConfig HomeController::rules() const {
    std::lock_guard<std::mutex> lk(rules_mu_);
    return pending_rules_;
}

void HomeController::apply_pending_rules() {
    std::lock_guard<std::mutex> lk(rules_mu_);
    if (!rules_dirty_) return;
    rules_       = pending_rules_;
    rules_dirty_ = false;
    log_.info("rules", "Rule thresholds updated");
}

} // namespace homectl
