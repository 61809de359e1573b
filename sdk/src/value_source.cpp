// ─────────────────────────────────────────────────────────────────────────────
// homectl — Value source implementations
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/value_source.h"

#include <cmath>

namespace homectl {

// ─── RandomValueSource ──────────────────────────────────────────────────────

RandomValueSource::RandomValueSource(uint32_t seed)
    : rng_(seed != 0 ? seed : std::random_device{}())
{}

std::optional<SensorValue> RandomValueSource::sample(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature: {
            const double t = temperature_(rng_);
            return SensorValue{std::round(t * 100.0) / 100.0};
        }
        case SensorKind::Light:
            return SensorValue{lux_(rng_)};
        case SensorKind::Motion:
            return SensorValue{motion_(rng_)};
    }
    return std::nullopt;
}

// ─── ScriptedValueSource ────────────────────────────────────────────────────

ScriptedValueSource::ScriptedValueSource(
        const std::vector<ScriptedReading>& readings) {
    for (const auto& r : readings) push(r);
}

void ScriptedValueSource::push(const ScriptedReading& r) {
    std::lock_guard lock(mu_);
    temperature_.emplace_back(r.temperature);
    light_.emplace_back(r.lux);
    motion_.emplace_back(r.motion);
}

void ScriptedValueSource::push(SensorKind kind, SensorValue value) {
    std::lock_guard lock(mu_);
    queue_for(kind).push_back(value);
}

std::optional<SensorValue> ScriptedValueSource::sample(SensorKind kind) {
    std::lock_guard lock(mu_);
    auto& q = queue_for(kind);
    if (q.empty()) return std::nullopt;

    SensorValue v = q.front();
    q.pop_front();
    return v;
}

size_t ScriptedValueSource::pending(SensorKind kind) const {
    std::lock_guard lock(mu_);
    return queue_for(kind).size();
}

std::deque<SensorValue>& ScriptedValueSource::queue_for(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature: return temperature_;
        case SensorKind::Light:       return light_;
        case SensorKind::Motion:      break;
    }
    return motion_;
}

const std::deque<SensorValue>&
ScriptedValueSource::queue_for(SensorKind kind) const {
    switch (kind) {
        case SensorKind::Temperature: return temperature_;
        case SensorKind::Light:       return light_;
        case SensorKind::Motion:      break;
    }
    return motion_;
}

} // namespace homectl
