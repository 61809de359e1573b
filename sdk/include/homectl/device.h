// ─────────────────────────────────────────────────────────────────────────────
// homectl — Actuated devices (Light, Thermostat)
// ─────────────────────────────────────────────────────────────────────────────
//
// A Device is a closed sum type: the variant-specific tunable lives in a
// std::variant<LightState, ThermostatState>.  All mutation goes through the
// device's own mutators, which validate the requested value, apply it and
// notify the change listener.  Out-of-domain requests return false and leave
// the device untouched without notifying anyone.
//
// Usage:
//   auto light = homectl::Device::light("light_1", "Living Room Light");
//   light.set_listener([](const DeviceEvent& e) { /* log */ });
//   light.turn_on();
//   light.try_set_brightness(70);        // true
//   light.try_set_brightness(150);       // false, no-op
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/types.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace homectl {

// ─── Tunable domains ────────────────────────────────────────────────────────

inline constexpr int    kMinBrightness        = 0;
inline constexpr int    kMaxBrightness        = 100;
inline constexpr int    kDefaultBrightness    = 50;
inline constexpr double kMinTargetTemperature = 18.0;   // °C
inline constexpr double kMaxTargetTemperature = 30.0;   // °C
inline constexpr double kDefaultTargetTemperature = 24.0;

inline constexpr bool brightness_in_range(int level) noexcept {
    return level >= kMinBrightness && level <= kMaxBrightness;
}

inline constexpr bool target_temperature_in_range(double celsius) noexcept {
    return celsius >= kMinTargetTemperature && celsius <= kMaxTargetTemperature;
}

// ─── Variant state ──────────────────────────────────────────────────────────

struct LightState {
    int brightness{kDefaultBrightness};         ///< percent
};

struct ThermostatState {
    double target_temperature{kDefaultTargetTemperature};  ///< °C
};

// ─── Commands ───────────────────────────────────────────────────────────────

struct TurnOn {};
struct TurnOff {};
struct SetBrightness        { int level{0}; };
struct SetTargetTemperature { double celsius{0}; };

using DeviceCommand =
    std::variant<TurnOn, TurnOff, SetBrightness, SetTargetTemperature>;

// ─── Change notification ────────────────────────────────────────────────────

enum class DeviceField : uint8_t {
    Status            = 0,
    Brightness        = 1,
    TargetTemperature = 2,
};

inline const char* device_field_name(DeviceField f) {
    switch (f) {
        case DeviceField::Status:            return "status";
        case DeviceField::Brightness:        return "brightness";
        case DeviceField::TargetTemperature: return "target_temperature";
    }
    return "unknown";
}

/// Emitted after every successful mutation.
struct DeviceEvent {
    std::string  device_id;
    std::string  name;
    DeviceField  field{DeviceField::Status};
    DeviceStatus status{DeviceStatus::Off};   ///< status after the mutation
    double       value{0};                    ///< brightness / target, or 0/1 for status
};

using DeviceListener = std::function<void(const DeviceEvent&)>;

// ─── Device ─────────────────────────────────────────────────────────────────

class Device {
public:
    static Device light(std::string id, std::string name,
                        int brightness = kDefaultBrightness);
    static Device thermostat(std::string id, std::string name,
                             double target_temperature = kDefaultTargetTemperature);

    const std::string& id() const noexcept   { return id_; }
    const std::string& name() const noexcept { return name_; }
    DeviceKind kind() const noexcept;

    DeviceStatus status() const noexcept { return status_; }
    bool is_on() const noexcept { return status_ == DeviceStatus::On; }

    /// Light only; empty for a thermostat.
    std::optional<int> brightness() const noexcept;

    /// Thermostat only; empty for a light.
    std::optional<double> target_temperature() const noexcept;

    // ── Mutators ────────────────────────────────────────────────────────

    void turn_on();
    void turn_off();

    /// Accepts 0 ≤ level ≤ 100 on a light.  Returns whether it took effect.
    bool try_set_brightness(int level);

    /// Accepts 18 ≤ celsius ≤ 30 on a thermostat.  Returns whether it took
    /// effect.
    bool try_set_target_temperature(double celsius);

    /// Dispatch a command.  A tunable command aimed at the wrong variant
    /// is rejected.
    bool apply_command(const DeviceCommand& cmd);

    void set_listener(DeviceListener listener) { listener_ = std::move(listener); }

private:
    using State = std::variant<LightState, ThermostatState>;

    Device(std::string id, std::string name, State state);

    void set_status(DeviceStatus s);
    void notify(DeviceField field, double value) const;

    std::string    id_;
    std::string    name_;
    DeviceStatus   status_{DeviceStatus::Off};
    State          state_;
    DeviceListener listener_;
};

} // namespace homectl
