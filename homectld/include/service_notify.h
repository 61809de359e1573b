// ─────────────────────────────────────────────────────────────────────────────
// homectld — systemd notification helpers
// ─────────────────────────────────────────────────────────────────────────────
//
// Thin wrappers over sd_notify(3).  Each returns true when the service
// manager accepted the message; false when not running under systemd, on
// error, or when the build has no libsystemd.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include <cstdint>

namespace homectl::service {

bool notifyReady();
bool notifyStopping();
bool notifyWatchdog();
bool notifyStatus(uint64_t ticks);

} // namespace homectl::service
