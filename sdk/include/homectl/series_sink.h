// ─────────────────────────────────────────────────────────────────────────────
// homectl — Time-series sinks
// ─────────────────────────────────────────────────────────────────────────────
//
// A sink consumes the exported series once, after the control loop has
// stopped.  SvgChartSink draws the three metrics as stacked panels over
// elapsed time; CsvSeriesSink dumps the raw rows; FanoutSink forwards one
// series to several sinks.
//
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/recorder.h"
#include "homectl/types.h"

#include <memory>
#include <string>
#include <vector>

namespace homectl {

class ISeriesSink {
public:
    virtual ~ISeriesSink() = default;

    virtual std::string name() const = 0;

    virtual Status render(const std::vector<TimeSeriesRecord>& series) = 0;
};

// ─── SVG chart ──────────────────────────────────────────────────────────────

struct SvgChartOptions {
    int         width  = 1000;
    int         height = 600;
    std::string title  = "Smart Home Sensor Readings Over Time";
};

class SvgChartSink final : public ISeriesSink {
public:
    explicit SvgChartSink(std::string path, SvgChartOptions opts = {});

    std::string name() const override { return "svg:" + path_; }

    Status render(const std::vector<TimeSeriesRecord>& series) override;

    /// Build the SVG document without touching the filesystem.
    [[nodiscard]] std::string to_svg(
        const std::vector<TimeSeriesRecord>& series) const;

private:
    std::string     path_;
    SvgChartOptions opts_;
};

// ─── CSV dump ───────────────────────────────────────────────────────────────

class CsvSeriesSink final : public ISeriesSink {
public:
    explicit CsvSeriesSink(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "csv:" + path_; }

    Status render(const std::vector<TimeSeriesRecord>& series) override;

private:
    std::string path_;
};

// ─── Fan-out ────────────────────────────────────────────────────────────────

/// Renders into every child and returns the first failure (all children
/// are still attempted).
class FanoutSink final : public ISeriesSink {
public:
    void add(std::unique_ptr<ISeriesSink> sink) { sinks_.push_back(std::move(sink)); }

    [[nodiscard]] bool empty() const noexcept { return sinks_.empty(); }

    std::string name() const override;

    Status render(const std::vector<TimeSeriesRecord>& series) override;

private:
    std::vector<std::unique_ptr<ISeriesSink>> sinks_;
};

} // namespace homectl
