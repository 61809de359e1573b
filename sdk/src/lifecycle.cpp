// ─────────────────────────────────────────────────────────────────────────────
// homectl — LifecycleCoordinator implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/lifecycle.h"

namespace homectl {

LifecycleCoordinator::LifecycleCoordinator(
        std::unique_ptr<HomeController> controller,
        std::unique_ptr<ISeriesSink> sink,
        Logger& log)
    : controller_(std::move(controller))
    , sink_(std::move(sink))
    , log_(log) {}

LifecycleCoordinator::~LifecycleCoordinator() {
    stop();
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

Status LifecycleCoordinator::start(double interval_s) {
    if (!controller_) return Status::InternalError;
    if (!interval_in_range(interval_s)) return Status::InvalidParameter;
    if (stopped_.load(std::memory_order_acquire)) return Status::NotRunning;
    if (started_.exchange(true, std::memory_order_acq_rel))
        return Status::AlreadyRunning;

    // Enter Running on this thread so a stop() issued right after start()
    // cannot be overtaken by the worker.
    Status s = controller_->begin();
    if (s != Status::OK) {
        started_.store(false, std::memory_order_release);
        return s;
    }

    loop_thread_ = std::thread([this, interval_s] {
        const Status st = controller_->run_loop(interval_s);
        if (st != Status::OK) {
            log_.error("daemon", std::string("Control loop ended: ") +
                                 status_string(st));
        }
    });

    log_.info("daemon", "System is running. Send SIGINT or SIGTERM to stop.");
    return Status::OK;
}

void LifecycleCoordinator::run() {
    std::unique_lock<std::mutex> lk(shutdown_mu_);
    shutdown_cv_.wait(lk, [this] {
        return shutdown_flag_.load(std::memory_order_acquire);
    });
}

bool LifecycleCoordinator::wait_for_shutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(shutdown_mu_);
    return shutdown_cv_.wait_for(lk, timeout, [this] {
        return shutdown_flag_.load(std::memory_order_acquire);
    });
}

void LifecycleCoordinator::request_shutdown() {
    {
        std::lock_guard<std::mutex> lk(shutdown_mu_);
        shutdown_flag_.store(true, std::memory_order_release);
    }
    shutdown_cv_.notify_all();
}

Status LifecycleCoordinator::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) return Status::OK;

    request_shutdown();
    if (!started_.load(std::memory_order_acquire)) return Status::OK;

    controller_->stop();
    if (loop_thread_.joinable()) loop_thread_.join();

    // The loop thread is gone; the series can no longer change.
    const auto series = controller_->export_series();
    log_.info("daemon", "Control loop stopped after " +
                        std::to_string(series.size()) + " ticks");

    Status st = Status::OK;
    if (sink_) {
        log_.info("sink", "Rendering series to " + sink_->name());
        st = sink_->render(series);
        renders_.fetch_add(1, std::memory_order_acq_rel);
        if (st != Status::OK) {
            log_.error("sink", std::string("Rendering failed: ") +
                               status_string(st));
        }
    }

    log_.info("daemon", "System stopped gracefully.");
    return st;
}

} // namespace homectl
