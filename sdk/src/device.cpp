// ─────────────────────────────────────────────────────────────────────────────
// homectl — Device implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/device.h"

#include <utility>

namespace homectl {

// ─── Construction ───────────────────────────────────────────────────────────

Device::Device(std::string id, std::string name, State state)
    : id_(std::move(id))
    , name_(std::move(name))
    , state_(std::move(state))
{}

Device Device::light(std::string id, std::string name, int brightness) {
    return Device(std::move(id), std::move(name), LightState{brightness});
}

Device Device::thermostat(std::string id, std::string name,
                          double target_temperature) {
    return Device(std::move(id), std::move(name),
                  ThermostatState{target_temperature});
}

// ─── Accessors ──────────────────────────────────────────────────────────────

DeviceKind Device::kind() const noexcept {
    return std::holds_alternative<LightState>(state_) ? DeviceKind::Light
                                                      : DeviceKind::Thermostat;
}

std::optional<int> Device::brightness() const noexcept {
    if (const auto* l = std::get_if<LightState>(&state_)) return l->brightness;
    return std::nullopt;
}

std::optional<double> Device::target_temperature() const noexcept {
    if (const auto* t = std::get_if<ThermostatState>(&state_))
        return t->target_temperature;
    return std::nullopt;
}

// ─── Mutators ───────────────────────────────────────────────────────────────

void Device::turn_on()  { set_status(DeviceStatus::On); }
void Device::turn_off() { set_status(DeviceStatus::Off); }

bool Device::try_set_brightness(int level) {
    auto* l = std::get_if<LightState>(&state_);
    if (!l || !brightness_in_range(level)) return false;

    l->brightness = level;
    notify(DeviceField::Brightness, static_cast<double>(level));
    return true;
}

bool Device::try_set_target_temperature(double celsius) {
    auto* t = std::get_if<ThermostatState>(&state_);
    if (!t || !target_temperature_in_range(celsius)) return false;

    t->target_temperature = celsius;
    notify(DeviceField::TargetTemperature, celsius);
    return true;
}

bool Device::apply_command(const DeviceCommand& cmd) {
    if (std::holds_alternative<TurnOn>(cmd)) {
        turn_on();
        return true;
    }
    if (std::holds_alternative<TurnOff>(cmd)) {
        turn_off();
        return true;
    }
    if (const auto* b = std::get_if<SetBrightness>(&cmd))
        return try_set_brightness(b->level);
    if (const auto* t = std::get_if<SetTargetTemperature>(&cmd))
        return try_set_target_temperature(t->celsius);
    return false;
}

// ─── Private helpers ────────────────────────────────────────────────────────

// The status domain is closed, so every assignment is accepted and reported,
// including a re-assignment of the current value.
void Device::set_status(DeviceStatus s) {
    status_ = s;
    notify(DeviceField::Status, s == DeviceStatus::On ? 1.0 : 0.0);
}

void Device::notify(DeviceField field, double value) const {
    if (!listener_) return;

    DeviceEvent ev;
    ev.device_id = id_;
    ev.name      = name_;
    ev.field     = field;
    ev.status    = status_;
    ev.value     = value;
    listener_(ev);
}

} // namespace homectl
