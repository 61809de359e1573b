// ─────────────────────────────────────────────────────────────────────────────
// homectl — LifecycleCoordinator
// ─────────────────────────────────────────────────────────────────────────────
//
// Runs exactly one HomeController on a background thread while the caller's
// thread waits for a shutdown request, then shuts down in order:
//
//   request_shutdown()          (any thread)
//        │
//   stop()                      (foreground)
//     ├─ controller.stop()      loop finishes its tick, sleep is cut short
//     ├─ join loop thread       happens-before edge for the export
//     ├─ export_series()
//     └─ sink.render(series)    exactly once
//
// stop() is idempotent; the destructor calls it.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/controller.h"
#include "homectl/logger.h"
#include "homectl/series_sink.h"
#include "homectl/types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace homectl {

class LifecycleCoordinator {
public:
    /// `sink` may be null (the series is then only logged as a count).
    LifecycleCoordinator(std::unique_ptr<HomeController> controller,
                         std::unique_ptr<ISeriesSink> sink,
                         Logger& log);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Launch the control loop on its own thread.
    Status start(double interval_s);

    /// Block until request_shutdown() is called.
    void run();

    /// Block for at most `timeout`.  Returns true once shutdown was requested.
    bool wait_for_shutdown(std::chrono::milliseconds timeout);

    /// Ask the foreground wait to return.  Thread-safe.
    void request_shutdown();

    /// Ordered shutdown (see header comment).  Returns the sink's status.
    Status stop();

    // ── Status ──────────────────────────────────────────────────────────

    [[nodiscard]] bool started() const noexcept {
        return started_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool shutdown_requested() const noexcept {
        return shutdown_flag_.load(std::memory_order_acquire);
    }

    /// Number of times the sink has been invoked (0 or 1).
    [[nodiscard]] int renders() const noexcept {
        return renders_.load(std::memory_order_acquire);
    }

    HomeController&       controller()       { return *controller_; }
    const HomeController& controller() const { return *controller_; }

private:
    std::unique_ptr<HomeController> controller_;
    std::unique_ptr<ISeriesSink>    sink_;
    Logger&                         log_;

    std::thread                     loop_thread_;
    std::atomic<bool>               started_{false};
    std::atomic<bool>               stopped_{false};
    std::atomic<int>                renders_{0};

    std::atomic<bool>               shutdown_flag_{false};
    std::mutex                      shutdown_mu_;
    std::condition_variable         shutdown_cv_;
};

} // namespace homectl
