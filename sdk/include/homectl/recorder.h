// ─────────────────────────────────────────────────────────────────────────────
// homectl — Time-series recorder
// ─────────────────────────────────────────────────────────────────────────────
//
// Keeps one row per control-loop tick for later inspection and rendering.
//
// Design decisions:
//
//   • **Append-only**: rows are stored in tick order and never modified.
//     The control loop is the only writer and supplies non-decreasing
//     elapsed times.
//
//   • **Snapshot export**: `export_series()` copies the rows out under the
//     lock, so a reader never observes a half-appended row.  The lifecycle
//     coordinator only exports after the loop thread has been joined.
//
// Usage:
//   homectl::TimeSeriesRecorder rec;
//   rec.append(0.0, 24.3, 180, 1);
//   auto rows = rec.export_series();
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace homectl {

/// One recorded tick.
struct TimeSeriesRecord {
    double elapsed_seconds{0};      ///< since loop start
    double temperature{0};          ///< °C
    int    light_intensity{0};      ///< lux
    int    motion_flag{0};          ///< 1 = motion detected
};

class TimeSeriesRecorder {
public:
    TimeSeriesRecorder() = default;

    TimeSeriesRecorder(const TimeSeriesRecorder&) = delete;
    TimeSeriesRecorder& operator=(const TimeSeriesRecorder&) = delete;

    void append(double elapsed_seconds, double temperature,
                int light_intensity, int motion_flag);

    /// Read-only copy of every row in insertion order.
    [[nodiscard]] std::vector<TimeSeriesRecord> export_series() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex            mtx_;
    std::vector<TimeSeriesRecord> rows_;
};

} // namespace homectl
