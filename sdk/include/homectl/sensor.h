// ─────────────────────────────────────────────────────────────────────────────
// homectl — Environmental sensors (Temperature, Light, Motion)
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/types.h"
#include "homectl/value_source.h"

#include <memory>
#include <optional>
#include <string>

namespace homectl {

/// A polled sensor.  `value()` is empty until the first successful read;
/// each successful read overwrites it.
class Sensor {
public:
    Sensor(std::string id, std::string name, SensorKind kind,
           std::shared_ptr<IValueSource> source);

    const std::string& id() const noexcept   { return id_; }
    const std::string& name() const noexcept { return name_; }
    SensorKind kind() const noexcept         { return kind_; }

    /// Pull one sample from the value source.  Returns
    /// Status::SensorUnavailable (and keeps the previous value) when the
    /// source has nothing, or hands back a sample of the wrong type.
    Status read_value();

    const std::optional<SensorValue>& value() const noexcept { return value_; }

    // Typed views; empty when unread or when called on another kind.
    std::optional<double> temperature() const noexcept;
    std::optional<int>    lux() const noexcept;
    std::optional<bool>   motion() const noexcept;

    /// Human-readable last value ("None" before the first read).
    std::string value_string() const;

private:
    bool matches_kind(const SensorValue& v) const noexcept;

    std::string                   id_;
    std::string                   name_;
    SensorKind                    kind_;
    std::shared_ptr<IValueSource> source_;
    std::optional<SensorValue>    value_;
};

} // namespace homectl
