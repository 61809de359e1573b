// ─────────────────────────────────────────────────────────────────────────────
// homectl — TelemetryPublisher implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/telemetry_publisher.h"

#include <cstdio>

#ifdef HOMECTL_HAS_ZMQ
#include <zmq.h>
#endif

namespace homectl {

std::string TelemetryPublisher::format(const DeviceEvent& ev) {
    std::string out = "device " + ev.device_id + " " +
                      device_field_name(ev.field) + " ";
    if (ev.field == DeviceField::Status) {
        out += device_status_name(ev.status);
    } else {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", ev.value);
        out += buf;
    }
    return out;
}

bool TelemetryPublisher::open(const std::string& endpoint) {
#ifdef HOMECTL_HAS_ZMQ
    std::lock_guard<std::mutex> lk(mu_);
    if (sock_) return true;

    ctx_ = zmq_ctx_new();
    if (!ctx_) return false;

    sock_ = zmq_socket(ctx_, ZMQ_PUB);
    if (!sock_ || zmq_bind(sock_, endpoint.c_str()) != 0) {
        if (sock_) { zmq_close(sock_); sock_ = nullptr; }
        zmq_ctx_destroy(ctx_);
        ctx_ = nullptr;
        return false;
    }
    return true;
#else
    (void)endpoint;
    return false;
#endif
}

void TelemetryPublisher::publish(const DeviceEvent& ev) {
#ifdef HOMECTL_HAS_ZMQ
    std::lock_guard<std::mutex> lk(mu_);
    if (!sock_) return;
    const std::string msg = format(ev);
    if (zmq_send(sock_, msg.data(), msg.size(), ZMQ_DONTWAIT) >= 0)
        ++published_;
#else
    (void)ev;
#endif
}

bool TelemetryPublisher::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sock_ != nullptr;
}

uint64_t TelemetryPublisher::published() const {
    std::lock_guard<std::mutex> lk(mu_);
    return published_;
}

void TelemetryPublisher::close() {
#ifdef HOMECTL_HAS_ZMQ
    std::lock_guard<std::mutex> lk(mu_);
    if (sock_) { zmq_close(sock_);       sock_ = nullptr; }
    if (ctx_)  { zmq_ctx_destroy(ctx_);  ctx_  = nullptr; }
#endif
}

} // namespace homectl
