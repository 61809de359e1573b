// ─────────────────────────────────────────────────────────────────────────────
// homectl — Recorder implementation
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/recorder.h"

namespace homectl {

void TimeSeriesRecorder::append(double elapsed_seconds, double temperature,
                                int light_intensity, int motion_flag) {
    TimeSeriesRecord r;
    r.elapsed_seconds = elapsed_seconds;
    r.temperature     = temperature;
    r.light_intensity = light_intensity;
    r.motion_flag     = motion_flag;

    std::lock_guard lock(mtx_);
    rows_.push_back(r);
}

std::vector<TimeSeriesRecord> TimeSeriesRecorder::export_series() const {
    std::lock_guard lock(mtx_);
    return rows_;
}

std::size_t TimeSeriesRecorder::size() const {
    std::lock_guard lock(mtx_);
    return rows_.size();
}

} // namespace homectl
