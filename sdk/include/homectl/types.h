// ─────────────────────────────────────────────────────────────────────────────
// homectl — Core type definitions
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace homectl {

// ─── Timestamp ──────────────────────────────────────────────────────────────

/// Nanosecond-precision timestamp on the steady (monotonic) clock.
struct Timestamp {
    int64_t nanoseconds{0};

    static Timestamp now() {
        using clock = std::chrono::steady_clock;
        auto d = clock::now().time_since_epoch();
        return {std::chrono::duration_cast<std::chrono::nanoseconds>(d).count()};
    }

    static Timestamp from_seconds(double s) {
        return {static_cast<int64_t>(s * 1.0e9)};
    }

    double to_seconds() const { return nanoseconds / 1.0e9; }

    Timestamp operator-(const Timestamp& o) const { return {nanoseconds - o.nanoseconds}; }
    Timestamp operator+(const Timestamp& o) const { return {nanoseconds + o.nanoseconds}; }
    bool operator<(const Timestamp& o)  const { return nanoseconds < o.nanoseconds; }
    bool operator<=(const Timestamp& o) const { return nanoseconds <= o.nanoseconds; }
    bool operator>(const Timestamp& o)  const { return nanoseconds > o.nanoseconds; }
    bool operator>=(const Timestamp& o) const { return nanoseconds >= o.nanoseconds; }
    bool operator==(const Timestamp& o) const { return nanoseconds == o.nanoseconds; }
};

// ─── Device / sensor identifiers ───────────────────────────────────────────

enum class DeviceKind : uint8_t {
    Light      = 0,
    Thermostat = 1,
};

inline const char* device_kind_name(DeviceKind k) {
    switch (k) {
        case DeviceKind::Light:      return "Light";
        case DeviceKind::Thermostat: return "Thermostat";
    }
    return "Unknown";
}

enum class DeviceStatus : uint8_t {
    Off = 0,
    On  = 1,
};

inline const char* device_status_name(DeviceStatus s) {
    switch (s) {
        case DeviceStatus::Off: return "off";
        case DeviceStatus::On:  return "on";
    }
    return "unknown";
}

enum class SensorKind : uint8_t {
    Temperature = 0,
    Light       = 1,
    Motion      = 2,
};

inline const char* sensor_kind_name(SensorKind k) {
    switch (k) {
        case SensorKind::Temperature: return "Temperature";
        case SensorKind::Light:       return "Light";
        case SensorKind::Motion:      return "Motion";
    }
    return "Unknown";
}

/// One sensor sample.  Temperature → double (°C), Light → int (lux),
/// Motion → bool.
using SensorValue = std::variant<double, int, bool>;

// ─── Status / error codes ──────────────────────────────────────────────────

enum class Status : int {
    OK                  =  0,
    InvalidParameter    = -1,
    AlreadyRunning      = -2,
    NotRunning          = -3,
    SensorUnavailable   = -4,
    IoError             = -5,
    InternalError       = -99,
};

inline const char* status_string(Status s) {
    switch (s) {
        case Status::OK:                return "OK";
        case Status::InvalidParameter:  return "InvalidParameter";
        case Status::AlreadyRunning:    return "AlreadyRunning";
        case Status::NotRunning:        return "NotRunning";
        case Status::SensorUnavailable: return "SensorUnavailable";
        case Status::IoError:           return "IoError";
        case Status::InternalError:     return "InternalError";
    }
    return "Unknown";
}

} // namespace homectl
