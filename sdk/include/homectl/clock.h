// ─────────────────────────────────────────────────────────────────────────────
// homectl — Clock abstraction
// ─────────────────────────────────────────────────────────────────────────────
//
// The control loop and the lighting rule read "now" through IClock so that
// the motion timeout can be exercised deterministically.  Production code
// uses SteadyClock; tests and replays use ManualClock.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/types.h"

#include <atomic>
#include <cstdint>

namespace homectl {

class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
};

/// Monotonic wall clock.
class SteadyClock final : public IClock {
public:
    Timestamp now() const override { return Timestamp::now(); }
};

/// Clock that only moves when told to.  Safe to advance from one thread
/// while another reads it.
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = {}) : ns_(start.nanoseconds) {}

    Timestamp now() const override {
        return {ns_.load(std::memory_order_acquire)};
    }

    void advance(double seconds) {
        ns_.fetch_add(Timestamp::from_seconds(seconds).nanoseconds,
                      std::memory_order_acq_rel);
    }

    void set(Timestamp t) { ns_.store(t.nanoseconds, std::memory_order_release); }

private:
    std::atomic<int64_t> ns_;
};

} // namespace homectl
