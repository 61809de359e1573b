// ─────────────────────────────────────────────────────────────────────────────
// homectl — Basic run demo
// ─────────────────────────────────────────────────────────────────────────────
//
// Runs the random simulation on a background thread for a few seconds,
// forwards device changes to a callback, then stops and renders the series
// to an SVG chart.
//
// Usage:
//   ./basic_run [seconds] [output.svg]
//
// ─────────────────────────────────────────────────────────────────────────────

#include "homectl/homectl.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

using namespace homectl;

int main(int argc, char* argv[]) {
    const int run_seconds = (argc > 1) ? std::atoi(argv[1]) : 3;
    const std::string svg_path = (argc > 2) ? argv[2] : "basic_run.svg";

    Logger log;

    ControllerConfig cfg;
    cfg.interval_s = 0.25;

    auto controller = std::make_unique<HomeController>(
        cfg, std::make_shared<RandomValueSource>(), nullptr, log);

    std::atomic<int> changes{0};
    controller->on_device_event([&changes](const DeviceEvent& ev) {
        ++changes;
        std::printf("  event: %s %s -> %s\n", ev.device_id.c_str(),
                    device_field_name(ev.field),
                    device_status_name(ev.status));
    });

    LifecycleCoordinator coord(std::move(controller),
                               std::make_unique<SvgChartSink>(svg_path), log);

    Status s = coord.start(cfg.interval_s);
    if (s != Status::OK) {
        std::fprintf(stderr, "start failed: %s\n", status_string(s));
        return 1;
    }

    // Nobody calls request_shutdown(), so this is a plain timed wait.
    coord.wait_for_shutdown(std::chrono::seconds(run_seconds > 0 ? run_seconds : 1));

    s = coord.stop();
    std::printf("\n%llu ticks, %d device changes, chart: %s (%s)\n",
                static_cast<unsigned long long>(coord.controller().ticks()),
                changes.load(), svg_path.c_str(), status_string(s));
    return s == Status::OK ? 0 : 1;
}
