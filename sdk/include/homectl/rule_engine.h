// ─────────────────────────────────────────────────────────────────────────────
// homectl — Rule engine
// ─────────────────────────────────────────────────────────────────────────────
//
// Two independent decision rules, evaluated once per tick in this order:
//
//   Thermostat   t > target + band  → Cooling → turn on
//                t < target − band  → Heating → turn on
//                otherwise          → Stable  → turn off
//
//   Lighting     motion:    refresh last-motion time; if lux < threshold
//                           and the light is off → turn on, brightness 70
//                no motion: if the light is on and more than the timeout
//                           has elapsed since the last motion → turn off
//
// `decide_*` are pure functions of their arguments.  `apply_*` evaluate the
// decision and carry it out on the device.
//
// The device has no heat/cool mode: Cooling and Heating both switch it on.
// The decision value is kept so the caller can log the reason.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/device.h"
#include "homectl/types.h"

namespace homectl {

struct RuleConfig {
    /// Half-width of the thermostat's stable band (°C, inclusive).
    double thermostat_band_c = 1.0;

    /// The light is only switched on by motion below this level (lux).
    int    lux_threshold     = 200;

    /// Brightness applied when motion switches the light on (percent).
    int    motion_brightness = 70;

    /// The light is switched off once no motion has been seen for longer
    /// than this (seconds).
    double motion_timeout_s  = 30.0;
};

// ─── Thermostat ─────────────────────────────────────────────────────────────

enum class ThermostatDecision : uint8_t {
    Cooling = 0,
    Heating = 1,
    Stable  = 2,
};

inline const char* thermostat_decision_name(ThermostatDecision d) {
    switch (d) {
        case ThermostatDecision::Cooling: return "Cooling";
        case ThermostatDecision::Heating: return "Heating";
        case ThermostatDecision::Stable:  return "Stable";
    }
    return "Unknown";
}

[[nodiscard]] ThermostatDecision decide_thermostat(
    double current_c, double target_c, const RuleConfig& cfg = {}) noexcept;

/// Evaluate the thermostat rule and switch `thermostat` accordingly.
ThermostatDecision apply_thermostat_rule(
    Device& thermostat, double current_c, const RuleConfig& cfg = {});

// ─── Lighting ───────────────────────────────────────────────────────────────

enum class LightingAction : uint8_t {
    None         = 0,
    TurnOnDimmed = 1,   ///< turn on, then set motion brightness
    TurnOff      = 2,
};

inline const char* lighting_action_name(LightingAction a) {
    switch (a) {
        case LightingAction::None:         return "None";
        case LightingAction::TurnOnDimmed: return "TurnOnDimmed";
        case LightingAction::TurnOff:      return "TurnOff";
    }
    return "Unknown";
}

struct LightingDecision {
    bool           refresh_motion_time{false};
    LightingAction action{LightingAction::None};
};

/// `seconds_since_motion` is only consulted when `motion` is false.
[[nodiscard]] LightingDecision decide_lighting(
    bool motion, int lux, DeviceStatus light_status,
    double seconds_since_motion, const RuleConfig& cfg = {}) noexcept;

/// Evaluate the lighting rule at time `now`, refresh `last_motion` when
/// motion is present, and switch `light` accordingly.
LightingAction apply_lighting_rule(
    Device& light, bool motion, int lux,
    Timestamp now, Timestamp& last_motion, const RuleConfig& cfg = {});

} // namespace homectl
