// ─────────────────────────────────────────────────────────────────────────────
// homectl — Sensor implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/sensor.h"

#include <cstdio>
#include <utility>

namespace homectl {

Sensor::Sensor(std::string id, std::string name, SensorKind kind,
               std::shared_ptr<IValueSource> source)
    : id_(std::move(id))
    , name_(std::move(name))
    , kind_(kind)
    , source_(std::move(source))
{}

Status Sensor::read_value() {
    if (!source_) return Status::SensorUnavailable;

    auto v = source_->sample(kind_);
    if (!v || !matches_kind(*v)) return Status::SensorUnavailable;

    value_ = *v;
    return Status::OK;
}

std::optional<double> Sensor::temperature() const noexcept {
    if (kind_ != SensorKind::Temperature || !value_) return std::nullopt;
    return std::get<double>(*value_);
}

std::optional<int> Sensor::lux() const noexcept {
    if (kind_ != SensorKind::Light || !value_) return std::nullopt;
    return std::get<int>(*value_);
}

std::optional<bool> Sensor::motion() const noexcept {
    if (kind_ != SensorKind::Motion || !value_) return std::nullopt;
    return std::get<bool>(*value_);
}

std::string Sensor::value_string() const {
    if (!value_) return "None";

    if (const auto* d = std::get_if<double>(&*value_)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", *d);
        return buf;
    }
    if (const auto* i = std::get_if<int>(&*value_)) return std::to_string(*i);
    return std::get<bool>(*value_) ? "True" : "False";
}

bool Sensor::matches_kind(const SensorValue& v) const noexcept {
    switch (kind_) {
        case SensorKind::Temperature: return std::holds_alternative<double>(v);
        case SensorKind::Light:       return std::holds_alternative<int>(v);
        case SensorKind::Motion:      return std::holds_alternative<bool>(v);
    }
    return false;
}

} // namespace homectl
