// ─────────────────────────────────────────────────────────────────────────────
// homectld — systemd notification helpers
// ─────────────────────────────────────────────────────────────────────────────
#include "service_notify.h"

#ifdef HOMECTL_HAS_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace homectl::service {

bool notifyReady() {
#ifdef HOMECTL_HAS_SYSTEMD
    return sd_notify(0, "READY=1") > 0;
#else
    return false;
#endif
}

bool notifyStopping() {
#ifdef HOMECTL_HAS_SYSTEMD
    return sd_notify(0, "STOPPING=1") > 0;
#else
    return false;
#endif
}

bool notifyWatchdog() {
#ifdef HOMECTL_HAS_SYSTEMD
    return sd_notify(0, "WATCHDOG=1") > 0;
#else
    return false;
#endif
}

bool notifyStatus(uint64_t ticks) {
#ifdef HOMECTL_HAS_SYSTEMD
    return sd_notifyf(0, "STATUS=ticks=%lu",
                      static_cast<unsigned long>(ticks)) > 0;
#else
    (void)ticks;
    return false;
#endif
}

} // namespace homectl::service
