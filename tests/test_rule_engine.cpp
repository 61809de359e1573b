// ─────────────────────────────────────────────────────────────────────────────
// homectl — Rule Engine Tests
// ─────────────────────────────────────────────────────────────────────────────
//
// Exercises the thermostat and lighting decisions at and around every
// threshold, and the apply_* helpers against real devices.
//
// Run:
//   ./test_rule_engine
//
// ─────────────────────────────────────────────────────────────────────────────

#include "homectl/rule_engine.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

using namespace homectl;

// ═════════════════════════════════════════════════════════════════════════════
//  Test infrastructure
// ═════════════════════════════════════════════════════════════════════════════

static int g_tests_run    = 0;
static int g_tests_passed = 0;

#define TEST_CASE(name)                                                   \
    do {                                                                  \
        ++g_tests_run;                                                    \
        std::printf("  %-52s ", name);                                    \
    } while (0)

#define PASS()                                                            \
    do {                                                                  \
        ++g_tests_passed;                                                 \
        std::printf("[PASS]\n");                                          \
    } while (0)

#define FAIL(msg)                                                         \
    do {                                                                  \
        std::printf("[FAIL] %s (line %d)\n", msg, __LINE__);             \
        return;                                                           \
    } while (0)

#define ASSERT_EQ(a, b)                                                   \
    do { if ((a) != (b)) FAIL(#a " != " #b); } while (0)

#define ASSERT_TRUE(expr)                                                 \
    do { if (!(expr)) FAIL(#expr " is false"); } while (0)

#define ASSERT_FALSE(expr)                                                \
    do { if ((expr)) FAIL(#expr " is true"); } while (0)

// ── Helpers ─────────────────────────────────────────────────────────────

static Timestamp at(double seconds) { return Timestamp::from_seconds(seconds); }

// ═════════════════════════════════════════════════════════════════════════════
//  Thermostat
// ═════════════════════════════════════════════════════════════════════════════

void test_thermostat_decisions() {
    TEST_CASE("Thermostat decision table (target 24)");
    ASSERT_EQ(decide_thermostat(26.0, 24.0), ThermostatDecision::Cooling);
    ASSERT_EQ(decide_thermostat(25.01, 24.0), ThermostatDecision::Cooling);
    ASSERT_EQ(decide_thermostat(22.0, 24.0), ThermostatDecision::Heating);
    ASSERT_EQ(decide_thermostat(22.99, 24.0), ThermostatDecision::Heating);
    ASSERT_EQ(decide_thermostat(24.5, 24.0), ThermostatDecision::Stable);
    ASSERT_EQ(decide_thermostat(24.0, 24.0), ThermostatDecision::Stable);
    PASS();
}

void test_thermostat_band_inclusive() {
    TEST_CASE("Thermostat band edges are stable");
    ASSERT_EQ(decide_thermostat(25.0, 24.0), ThermostatDecision::Stable);
    ASSERT_EQ(decide_thermostat(23.0, 24.0), ThermostatDecision::Stable);
    PASS();
}

void test_thermostat_custom_band() {
    TEST_CASE("Thermostat honours configured band");
    RuleConfig cfg;
    cfg.thermostat_band_c = 0.0;
    ASSERT_EQ(decide_thermostat(24.1, 24.0, cfg), ThermostatDecision::Cooling);
    ASSERT_EQ(decide_thermostat(24.0, 24.0, cfg), ThermostatDecision::Stable);
    cfg.thermostat_band_c = 3.0;
    ASSERT_EQ(decide_thermostat(26.5, 24.0, cfg), ThermostatDecision::Stable);
    PASS();
}

void test_apply_thermostat() {
    TEST_CASE("apply_thermostat_rule switches device");
    auto t = Device::thermostat("thermostat_1", "Main Thermostat");

    ASSERT_EQ(apply_thermostat_rule(t, 26.0), ThermostatDecision::Cooling);
    ASSERT_TRUE(t.is_on());
    ASSERT_EQ(apply_thermostat_rule(t, 24.5), ThermostatDecision::Stable);
    ASSERT_FALSE(t.is_on());
    ASSERT_EQ(apply_thermostat_rule(t, 20.0), ThermostatDecision::Heating);
    ASSERT_TRUE(t.is_on());
    PASS();
}

void test_apply_thermostat_uses_device_target() {
    TEST_CASE("apply_thermostat_rule reads device target");
    auto t = Device::thermostat("t", "T", 20.0);
    ASSERT_EQ(apply_thermostat_rule(t, 22.0), ThermostatDecision::Cooling);
    ASSERT_TRUE(t.try_set_target_temperature(22.0));
    ASSERT_EQ(apply_thermostat_rule(t, 22.0), ThermostatDecision::Stable);
    PASS();
}

void test_thermostat_idempotent() {
    TEST_CASE("Thermostat rule is idempotent");
    auto t = Device::thermostat("t", "T");
    for (double temp : {26.0, 24.0, 21.0}) {
        apply_thermostat_rule(t, temp);
        const auto first = t.status();
        apply_thermostat_rule(t, temp);
        ASSERT_EQ(t.status(), first);
    }
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Lighting
// ═════════════════════════════════════════════════════════════════════════════

void test_lighting_motion_dark() {
    TEST_CASE("Motion + dark + off → on dimmed");
    auto d = decide_lighting(true, 150, DeviceStatus::Off, 0.0);
    ASSERT_TRUE(d.refresh_motion_time);
    ASSERT_EQ(d.action, LightingAction::TurnOnDimmed);
    PASS();
}

void test_lighting_motion_bright() {
    TEST_CASE("Motion + bright → no change");
    auto d = decide_lighting(true, 250, DeviceStatus::Off, 0.0);
    ASSERT_TRUE(d.refresh_motion_time);
    ASSERT_EQ(d.action, LightingAction::None);

    // Threshold is strict.
    d = decide_lighting(true, 200, DeviceStatus::Off, 0.0);
    ASSERT_EQ(d.action, LightingAction::None);
    d = decide_lighting(true, 199, DeviceStatus::Off, 0.0);
    ASSERT_EQ(d.action, LightingAction::TurnOnDimmed);
    PASS();
}

void test_lighting_motion_already_on() {
    TEST_CASE("Motion + dark + already on → no change");
    auto d = decide_lighting(true, 120, DeviceStatus::On, 100.0);
    ASSERT_TRUE(d.refresh_motion_time);
    ASSERT_EQ(d.action, LightingAction::None);
    PASS();
}

void test_lighting_timeout() {
    TEST_CASE("No motion: off only after > 30 s");
    ASSERT_EQ(decide_lighting(false, 100, DeviceStatus::On, 31.0).action,
              LightingAction::TurnOff);
    ASSERT_EQ(decide_lighting(false, 100, DeviceStatus::On, 10.0).action,
              LightingAction::None);
    ASSERT_EQ(decide_lighting(false, 100, DeviceStatus::On, 30.0).action,
              LightingAction::None);
    ASSERT_EQ(decide_lighting(false, 100, DeviceStatus::Off, 300.0).action,
              LightingAction::None);
    ASSERT_FALSE(decide_lighting(false, 100, DeviceStatus::On, 31.0)
                     .refresh_motion_time);
    PASS();
}

void test_apply_lighting_sequence() {
    TEST_CASE("apply_lighting_rule over a timeline");
    auto light = Device::light("light_1", "Living Room Light");
    Timestamp last_motion = at(0.0);

    ASSERT_EQ(apply_lighting_rule(light, true, 180, at(10.0), last_motion),
              LightingAction::TurnOnDimmed);
    ASSERT_TRUE(light.is_on());
    ASSERT_EQ(*light.brightness(), 70);
    ASSERT_TRUE(last_motion == at(10.0));

    ASSERT_EQ(apply_lighting_rule(light, false, 300, at(35.0), last_motion),
              LightingAction::None);
    ASSERT_TRUE(light.is_on());
    ASSERT_TRUE(last_motion == at(10.0));

    ASSERT_EQ(apply_lighting_rule(light, false, 300, at(40.5), last_motion),
              LightingAction::TurnOff);
    ASSERT_FALSE(light.is_on());
    PASS();
}

void test_apply_lighting_custom_config() {
    TEST_CASE("apply_lighting_rule honours RuleConfig");
    RuleConfig cfg;
    cfg.lux_threshold     = 500;
    cfg.motion_brightness = 40;
    cfg.motion_timeout_s  = 5.0;

    auto light = Device::light("l", "L");
    Timestamp last_motion = at(0.0);
    apply_lighting_rule(light, true, 450, at(1.0), last_motion, cfg);
    ASSERT_TRUE(light.is_on());
    ASSERT_EQ(*light.brightness(), 40);

    apply_lighting_rule(light, false, 450, at(6.5), last_motion, cfg);
    ASSERT_FALSE(light.is_on());
    PASS();
}

void test_apply_lighting_bad_brightness() {
    TEST_CASE("Out-of-range motion brightness keeps level");
    RuleConfig cfg;
    cfg.motion_brightness = 150;

    auto light = Device::light("l", "L");
    Timestamp last_motion = at(0.0);
    ASSERT_EQ(apply_lighting_rule(light, true, 50, at(1.0), last_motion, cfg),
              LightingAction::TurnOnDimmed);
    ASSERT_TRUE(light.is_on());
    ASSERT_EQ(*light.brightness(), 50);
    PASS();
}

void test_names() {
    TEST_CASE("Decision names");
    ASSERT_EQ(std::string(thermostat_decision_name(ThermostatDecision::Cooling)),
              "Cooling");
    ASSERT_EQ(std::string(lighting_action_name(LightingAction::TurnOff)),
              "TurnOff");
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Main
// ═════════════════════════════════════════════════════════════════════════════

int main() {
    std::printf("═══════════════════════════════════════════════════════════\n");
    std::printf("  homectl — Rule Engine Tests\n");
    std::printf("═══════════════════════════════════════════════════════════\n\n");

    // Thermostat.
    test_thermostat_decisions();
    test_thermostat_band_inclusive();
    test_thermostat_custom_band();
    test_apply_thermostat();
    test_apply_thermostat_uses_device_target();
    test_thermostat_idempotent();

    // Lighting.
    test_lighting_motion_dark();
    test_lighting_motion_bright();
    test_lighting_motion_already_on();
    test_lighting_timeout();
    test_apply_lighting_sequence();
    test_apply_lighting_custom_config();
    test_apply_lighting_bad_brightness();

    test_names();

    std::printf("\n═══════════════════════════════════════════════════════════\n");
    std::printf("  Results: %d / %d passed\n", g_tests_passed, g_tests_run);
    std::printf("═══════════════════════════════════════════════════════════\n");

    return (g_tests_passed == g_tests_run) ? 0 : 1;
}
