// ─────────────────────────────────────────────────────────────────────────────
// homectl — Device tests
// ─────────────────────────────────────────────────────────────────────────────
//
// Standalone test harness for Device (Light / Thermostat).  Covers the
// tunable domains, command dispatch and change notification.
//
// Build:
//   cmake -DHOMECTL_BUILD_TESTS=ON ..
//   make test_device
//
// ─────────────────────────────────────────────────────────────────────────────

#include "homectl/device.h"

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

#define ASSERT_NEAR(a, b, tol)                                            \
    do {                                                                  \
        if (std::abs(static_cast<double>(a) - static_cast<double>(b))     \
            > (tol))                                                      \
            FAIL(#a " not near " #b);                                     \
    } while (0)

// ── Helpers ─────────────────────────────────────────────────────────────

struct EventLog {
    std::vector<DeviceEvent> events;
    DeviceListener listener() {
        return [this](const DeviceEvent& e) { events.push_back(e); };
    }
};

// ═════════════════════════════════════════════════════════════════════════════
//  Construction
// ═════════════════════════════════════════════════════════════════════════════

void test_light_defaults() {
    TEST_CASE("Light defaults (off, brightness 50)");
    auto light = Device::light("light_1", "Living Room Light");
    ASSERT_EQ(light.kind(), DeviceKind::Light);
    ASSERT_EQ(light.status(), DeviceStatus::Off);
    ASSERT_FALSE(light.is_on());
    ASSERT_TRUE(light.brightness().has_value());
    ASSERT_EQ(*light.brightness(), 50);
    ASSERT_FALSE(light.target_temperature().has_value());
    ASSERT_EQ(light.id(), std::string("light_1"));
    ASSERT_EQ(light.name(), std::string("Living Room Light"));
    PASS();
}

void test_thermostat_defaults() {
    TEST_CASE("Thermostat defaults (off, target 24)");
    auto t = Device::thermostat("thermostat_1", "Main Thermostat");
    ASSERT_EQ(t.kind(), DeviceKind::Thermostat);
    ASSERT_EQ(t.status(), DeviceStatus::Off);
    ASSERT_TRUE(t.target_temperature().has_value());
    ASSERT_NEAR(*t.target_temperature(), 24.0, 1e-9);
    ASSERT_FALSE(t.brightness().has_value());
    PASS();
}

void test_names() {
    TEST_CASE("Enum names");
    ASSERT_EQ(std::string(device_kind_name(DeviceKind::Light)), "Light");
    ASSERT_EQ(std::string(device_kind_name(DeviceKind::Thermostat)), "Thermostat");
    ASSERT_EQ(std::string(device_status_name(DeviceStatus::On)), "on");
    ASSERT_EQ(std::string(device_status_name(DeviceStatus::Off)), "off");
    ASSERT_EQ(std::string(device_field_name(DeviceField::TargetTemperature)),
              "target_temperature");
    PASS();
}

void test_status_codes() {
    TEST_CASE("Status codes are contiguous and named");
    ASSERT_EQ(std::string(status_string(Status::OK)), "OK");
    ASSERT_EQ(std::string(status_string(Status::IoError)), "IoError");
    ASSERT_EQ(std::string(status_string(Status::InternalError)), "InternalError");
    // -1 .. -5 are the only failure codes besides InternalError.
    for (int code = -1; code >= -5; --code)
        ASSERT_TRUE(std::string(status_string(static_cast<Status>(code))) != "Unknown");
    ASSERT_EQ(std::string(status_string(static_cast<Status>(-6))), "Unknown");
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Tunable domains
// ═════════════════════════════════════════════════════════════════════════════

void test_brightness_domain() {
    TEST_CASE("Brightness accepted iff 0 <= b <= 100");
    auto light = Device::light("l", "L");
    for (int b = -5; b <= 105; ++b) {
        const int before = *light.brightness();
        const bool ok = light.try_set_brightness(b);
        if (b >= 0 && b <= 100) {
            ASSERT_TRUE(ok);
            ASSERT_EQ(*light.brightness(), b);
        } else {
            ASSERT_FALSE(ok);
            ASSERT_EQ(*light.brightness(), before);
        }
    }
    PASS();
}

void test_target_temperature_domain() {
    TEST_CASE("Target accepted iff 18 <= t <= 30");
    auto t = Device::thermostat("t", "T");
    ASSERT_TRUE(t.try_set_target_temperature(18.0));
    ASSERT_NEAR(*t.target_temperature(), 18.0, 1e-9);
    ASSERT_TRUE(t.try_set_target_temperature(30.0));
    ASSERT_NEAR(*t.target_temperature(), 30.0, 1e-9);
    ASSERT_TRUE(t.try_set_target_temperature(21.5));

    ASSERT_FALSE(t.try_set_target_temperature(17.99));
    ASSERT_FALSE(t.try_set_target_temperature(30.01));
    ASSERT_FALSE(t.try_set_target_temperature(-40.0));
    ASSERT_NEAR(*t.target_temperature(), 21.5, 1e-9);
    PASS();
}

void test_tunable_on_wrong_variant() {
    TEST_CASE("Tunable of the other variant is rejected");
    auto light = Device::light("l", "L");
    auto t     = Device::thermostat("t", "T");
    ASSERT_FALSE(light.try_set_target_temperature(22.0));
    ASSERT_FALSE(t.try_set_brightness(70));
    ASSERT_EQ(*light.brightness(), 50);
    ASSERT_NEAR(*t.target_temperature(), 24.0, 1e-9);
    PASS();
}

void test_tunable_independent_of_status() {
    TEST_CASE("Brightness settable while off");
    auto light = Device::light("l", "L");
    ASSERT_TRUE(light.try_set_brightness(10));
    ASSERT_EQ(light.status(), DeviceStatus::Off);
    ASSERT_EQ(*light.brightness(), 10);
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Commands
// ═════════════════════════════════════════════════════════════════════════════

void test_apply_command() {
    TEST_CASE("apply_command dispatch");
    auto light = Device::light("l", "L");
    ASSERT_TRUE(light.apply_command(TurnOn{}));
    ASSERT_TRUE(light.is_on());
    ASSERT_TRUE(light.apply_command(SetBrightness{80}));
    ASSERT_EQ(*light.brightness(), 80);
    ASSERT_FALSE(light.apply_command(SetBrightness{101}));
    ASSERT_FALSE(light.apply_command(SetTargetTemperature{22.0}));
    ASSERT_TRUE(light.apply_command(TurnOff{}));
    ASSERT_FALSE(light.is_on());

    auto t = Device::thermostat("t", "T");
    ASSERT_TRUE(t.apply_command(SetTargetTemperature{20.0}));
    ASSERT_NEAR(*t.target_temperature(), 20.0, 1e-9);
    ASSERT_FALSE(t.apply_command(SetBrightness{50}));
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Notification
// ═════════════════════════════════════════════════════════════════════════════

void test_status_events() {
    TEST_CASE("Every status assignment notifies");
    EventLog log;
    auto light = Device::light("light_1", "Living Room Light");
    light.set_listener(log.listener());

    light.turn_on();
    light.turn_on();        // same value, still reported
    light.turn_off();

    ASSERT_EQ(log.events.size(), 3u);
    ASSERT_EQ(log.events[0].field, DeviceField::Status);
    ASSERT_EQ(log.events[0].status, DeviceStatus::On);
    ASSERT_EQ(log.events[0].device_id, std::string("light_1"));
    ASSERT_EQ(log.events[0].name, std::string("Living Room Light"));
    ASSERT_EQ(log.events[1].status, DeviceStatus::On);
    ASSERT_EQ(log.events[2].status, DeviceStatus::Off);
    PASS();
}

void test_tunable_events() {
    TEST_CASE("Accepted tunables notify, rejected do not");
    EventLog log;
    auto light = Device::light("l", "L");
    light.set_listener(log.listener());

    ASSERT_TRUE(light.try_set_brightness(70));
    ASSERT_FALSE(light.try_set_brightness(150));
    ASSERT_FALSE(light.try_set_target_temperature(20.0));

    ASSERT_EQ(log.events.size(), 1u);
    ASSERT_EQ(log.events[0].field, DeviceField::Brightness);
    ASSERT_NEAR(log.events[0].value, 70.0, 1e-9);

    EventLog tlog;
    auto t = Device::thermostat("t", "T");
    t.set_listener(tlog.listener());
    ASSERT_TRUE(t.try_set_target_temperature(19.5));
    ASSERT_FALSE(t.try_set_target_temperature(35.0));
    ASSERT_EQ(tlog.events.size(), 1u);
    ASSERT_EQ(tlog.events[0].field, DeviceField::TargetTemperature);
    ASSERT_NEAR(tlog.events[0].value, 19.5, 1e-9);
    PASS();
}

void test_no_listener() {
    TEST_CASE("Mutators work without a listener");
    auto light = Device::light("l", "L");
    light.turn_on();
    ASSERT_TRUE(light.try_set_brightness(0));
    ASSERT_TRUE(light.is_on());
    ASSERT_EQ(*light.brightness(), 0);
    PASS();
}

// ═════════════════════════════════════════════════════════════════════════════
//  Main
// ═════════════════════════════════════════════════════════════════════════════

int main() {
    std::printf("═══════════════════════════════════════════════════════════\n");
    std::printf("  homectl — Device Tests\n");
    std::printf("═══════════════════════════════════════════════════════════\n\n");

    test_light_defaults();
    test_thermostat_defaults();
    test_names();
    test_status_codes();

    test_brightness_domain();
    test_target_temperature_domain();
    test_tunable_on_wrong_variant();
    test_tunable_independent_of_status();

    test_apply_command();

    test_status_events();
    test_tunable_events();
    test_no_listener();

    std::printf("\n═══════════════════════════════════════════════════════════\n");
    std::printf("  Results: %d / %d passed\n", g_tests_passed, g_tests_run);
    std::printf("═══════════════════════════════════════════════════════════\n");

    return (g_tests_passed == g_tests_run) ? 0 : 1;
}
