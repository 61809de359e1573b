// ─────────────────────────────────────────────────────────────────────────────
// homectl — Device-change telemetry publisher (ZeroMQ PUB)
// ─────────────────────────────────────────────────────────────────────────────
//
// Publishes one text frame per DeviceEvent:
//
//   "device <device_id> <field> <value>"      e.g. "device light_1 status on"
//
// Output only; nothing is ever read back from the socket.  When the build
// has no libzmq, open() returns false and the daemon runs without telemetry.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/device.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace homectl {

class TelemetryPublisher {
public:
    TelemetryPublisher() = default;
    ~TelemetryPublisher() { close(); }

    TelemetryPublisher(const TelemetryPublisher&) = delete;
    TelemetryPublisher& operator=(const TelemetryPublisher&) = delete;

    /// Bind a PUB socket on `endpoint`.  Returns false on failure or when
    /// built without ZeroMQ.
    bool open(const std::string& endpoint);

    /// Non-blocking send; dropped if no subscriber keeps up.
    void publish(const DeviceEvent& ev);

    void close();

    // Both lock, since publish() runs on the control-loop thread.
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] uint64_t published() const;

    /// Wire text for an event (exposed for tests).
    static std::string format(const DeviceEvent& ev);

private:
    mutable std::mutex mu_;
    void*              ctx_{nullptr};
    void*              sock_{nullptr};
    uint64_t           published_{0};
};

} // namespace homectl
