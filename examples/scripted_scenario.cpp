// ─────────────────────────────────────────────────────────────────────────────
// homectl — Scripted scenario demo
// ─────────────────────────────────────────────────────────────────────────────
//
// Replays a fixed evening in the living room, tick by tick, on a manual
// clock:
//
//   1.  Someone walks in (26 °C, dim) → thermostat on, light on at 70 %.
//   2.  Five seconds later the room has cooled and is brighter.
//   3.  Half a minute without motion → light off.
//
// Then writes the recorded rows as CSV to stdout.
//
// Build:
//   cmake -S . -B build -DHOMECTL_BUILD_EXAMPLES=ON
//   cmake --build build --target scripted_scenario
//   ./build/examples/scripted_scenario
//
// ─────────────────────────────────────────────────────────────────────────────

#include "homectl/homectl.h"

#include <cstdio>
#include <memory>

using namespace homectl;

static void print_state(int tick, HomeController& home) {
    const Device& light = home.light();
    const Device& thermo = home.thermostat();
    std::printf("tick %d  light=%-3s brightness=%3d%%   thermostat=%-3s target=%.1f°C\n",
                tick,
                device_status_name(light.status()),
                light.brightness().value_or(-1),
                device_status_name(thermo.status()),
                thermo.target_temperature().value_or(0.0));
}

int main() {
    LogConfig lc;
    lc.level = LogLevel::Info;
    Logger log(lc);

    auto clock  = std::make_shared<ManualClock>();
    auto source = std::make_shared<ScriptedValueSource>();
    source->push({26.0, 180, true});
    source->push({24.5, 300, false});
    source->push({24.5, 300, false});

    HomeController home({}, source, clock, log);

    const double advance[] = {0.0, 5.0, 26.5};
    for (int i = 0; i < 3; ++i) {
        clock->advance(advance[i]);
        home.tick();
        print_state(i + 1, home);
    }

    std::printf("\nelapsed_seconds,temperature,light_intensity,motion_flag\n");
    for (const auto& r : home.export_series()) {
        std::printf("%.2f,%.2f,%d,%d\n", r.elapsed_seconds, r.temperature,
                    r.light_intensity, r.motion_flag);
    }
    return 0;
}
