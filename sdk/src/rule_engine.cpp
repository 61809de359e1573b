// ─────────────────────────────────────────────────────────────────────────────
// homectl — Rule engine implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/rule_engine.h"

namespace homectl {

// ─── Thermostat ─────────────────────────────────────────────────────────────

ThermostatDecision decide_thermostat(double current_c, double target_c,
                                     const RuleConfig& cfg) noexcept {
    if (current_c > target_c + cfg.thermostat_band_c)
        return ThermostatDecision::Cooling;
    if (current_c < target_c - cfg.thermostat_band_c)
        return ThermostatDecision::Heating;
    return ThermostatDecision::Stable;
}

ThermostatDecision apply_thermostat_rule(Device& thermostat, double current_c,
                                         const RuleConfig& cfg) {
    const double target =
        thermostat.target_temperature().value_or(kDefaultTargetTemperature);

    const auto d = decide_thermostat(current_c, target, cfg);
    if (d == ThermostatDecision::Stable)
        thermostat.turn_off();
    else
        thermostat.turn_on();
    return d;
}

// ─── Lighting ───────────────────────────────────────────────────────────────

LightingDecision decide_lighting(bool motion, int lux,
                                 DeviceStatus light_status,
                                 double seconds_since_motion,
                                 const RuleConfig& cfg) noexcept {
    LightingDecision d;

    if (motion) {
        d.refresh_motion_time = true;
        if (lux < cfg.lux_threshold && light_status == DeviceStatus::Off)
            d.action = LightingAction::TurnOnDimmed;
        return d;
    }

    if (light_status == DeviceStatus::On &&
        seconds_since_motion > cfg.motion_timeout_s) {
        d.action = LightingAction::TurnOff;
    }
    return d;
}

LightingAction apply_lighting_rule(Device& light, bool motion, int lux,
                                   Timestamp now, Timestamp& last_motion,
                                   const RuleConfig& cfg) {
    const double since = (now - last_motion).to_seconds();
    const auto d = decide_lighting(motion, lux, light.status(), since, cfg);

    if (d.refresh_motion_time) last_motion = now;

    switch (d.action) {
        case LightingAction::TurnOnDimmed:
            light.turn_on();
            // Out-of-range configured brightness keeps the previous level.
            (void)light.try_set_brightness(cfg.motion_brightness);
            break;
        case LightingAction::TurnOff:
            light.turn_off();
            break;
        case LightingAction::None:
            break;
    }
    return d.action;
}

} // namespace homectl
