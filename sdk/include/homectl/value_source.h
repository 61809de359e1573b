// ─────────────────────────────────────────────────────────────────────────────
// homectl — Sensor value sources
// ─────────────────────────────────────────────────────────────────────────────
//
// A value source produces one sample per call for a given sensor kind.  The
// core treats it as opaque: in a real installation it would wrap hardware,
// here it is either a seeded random generator or a scripted sequence.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/types.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace homectl {

class IValueSource {
public:
    virtual ~IValueSource() = default;

    /// One fresh sample for `kind`, or empty if the source cannot produce one.
    virtual std::optional<SensorValue> sample(SensorKind kind) = 0;
};

// ─── Random source ──────────────────────────────────────────────────────────

/// Nominal distributions:
///   Temperature  uniform [20.0, 30.0] °C, rounded to 2 decimals
///   Light        uniform integer [100, 600] lux
///   Motion       fair coin
class RandomValueSource final : public IValueSource {
public:
    /// `seed == 0` seeds from std::random_device.
    explicit RandomValueSource(uint32_t seed = 0);

    std::optional<SensorValue> sample(SensorKind kind) override;

private:
    std::mt19937                           rng_;
    std::uniform_real_distribution<double> temperature_{20.0, 30.0};
    std::uniform_int_distribution<int>     lux_{100, 600};
    std::bernoulli_distribution            motion_{0.5};
};

// ─── Scripted source ────────────────────────────────────────────────────────

/// One tick's worth of readings for ScriptedValueSource.
struct ScriptedReading {
    double temperature{0};
    int    lux{0};
    bool   motion{false};
};

/// Replays queued samples in order, one queue per sensor kind.  An exhausted
/// queue makes that sensor unavailable.  Thread-safe.
class ScriptedValueSource final : public IValueSource {
public:
    ScriptedValueSource() = default;
    explicit ScriptedValueSource(const std::vector<ScriptedReading>& readings);

    void push(const ScriptedReading& r);
    void push(SensorKind kind, SensorValue value);

    std::optional<SensorValue> sample(SensorKind kind) override;

    [[nodiscard]] size_t pending(SensorKind kind) const;

private:
    std::deque<SensorValue>& queue_for(SensorKind kind);
    const std::deque<SensorValue>& queue_for(SensorKind kind) const;

    mutable std::mutex      mu_;
    std::deque<SensorValue> temperature_;
    std::deque<SensorValue> light_;
    std::deque<SensorValue> motion_;
};

} // namespace homectl
