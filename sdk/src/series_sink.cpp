// ─────────────────────────────────────────────────────────────────────────────
// homectl — Series sink implementations
// ─────────────────────────────────────────────────────────────────────────────
#include "homectl/series_sink.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace homectl {

namespace {

struct Panel {
    const char* label;
    const char* color;
    // Returns false for a missing sample (gap in the line).
    bool (*value)(const TimeSeriesRecord&, double&);
};

bool temperature_of(const TimeSeriesRecord& r, double& out) {
    if (std::isnan(r.temperature)) return false;
    out = r.temperature;
    return true;
}

bool light_of(const TimeSeriesRecord& r, double& out) {
    if (r.light_intensity < 0) return false;
    out = r.light_intensity;
    return true;
}

bool motion_of(const TimeSeriesRecord& r, double& out) {
    out = r.motion_flag;
    return true;
}

const Panel kPanels[] = {
    {"Temperature (°C)",              "red",    temperature_of},
    {"Light Intensity (lux)",         "orange", light_of},
    {"Motion Detected (1=Yes, 0=No)", "blue",   motion_of},
};

std::string num(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;
        }
    }
    return out;
}

bool write_file(const std::string& path, const std::string& body) {
    std::ofstream fs(path, std::ios::trunc);
    if (!fs) return false;
    fs << body;
    fs.flush();
    return static_cast<bool>(fs);
}

} // anonymous namespace

// ─── SvgChartSink ───────────────────────────────────────────────────────────

SvgChartSink::SvgChartSink(std::string path, SvgChartOptions opts)
    : path_(std::move(path))
    , opts_(std::move(opts))
{}

Status SvgChartSink::render(const std::vector<TimeSeriesRecord>& series) {
    if (path_.empty()) return Status::InvalidParameter;
    return write_file(path_, to_svg(series)) ? Status::OK : Status::IoError;
}

std::string SvgChartSink::to_svg(
        const std::vector<TimeSeriesRecord>& series) const {
    const double W = opts_.width;
    const double H = opts_.height;
    const double left = 80, right = 20, top = 50, bottom = 50, gap = 30;
    const double plot_w  = W - left - right;
    const double panel_h = (H - top - bottom - 2 * gap) / 3.0;

    double t_max = 0;
    for (const auto& r : series) t_max = std::max(t_max, r.elapsed_seconds);
    if (t_max <= 0) t_max = 1;

    std::ostringstream svg;
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << opts_.width
        << "\" height=\"" << opts_.height << "\" font-family=\"sans-serif\">\n";
    svg << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    svg << "<text x=\"" << num(W / 2) << "\" y=\"28\" text-anchor=\"middle\""
        << " font-size=\"18\">" << xml_escape(opts_.title) << "</text>\n";

    for (int p = 0; p < 3; ++p) {
        const Panel& panel = kPanels[p];
        const double y0 = top + p * (panel_h + gap);

        double v_min = 0, v_max = 0, v = 0;
        bool any = false;
        for (const auto& r : series) {
            if (!panel.value(r, v)) continue;
            if (!any) { v_min = v_max = v; any = true; }
            v_min = std::min(v_min, v);
            v_max = std::max(v_max, v);
        }
        if (v_max - v_min < 1e-9) { v_min -= 1; v_max += 1; }

        // Frame, grid and labels.
        svg << "<rect x=\"" << num(left) << "\" y=\"" << num(y0)
            << "\" width=\"" << num(plot_w) << "\" height=\"" << num(panel_h)
            << "\" fill=\"none\" stroke=\"#444\"/>\n";
        for (int g = 1; g < 4; ++g) {
            const double gy = y0 + panel_h * g / 4.0;
            svg << "<line x1=\"" << num(left) << "\" y1=\"" << num(gy)
                << "\" x2=\"" << num(left + plot_w) << "\" y2=\"" << num(gy)
                << "\" stroke=\"#ddd\"/>\n";
        }
        svg << "<text x=\"" << num(left - 6) << "\" y=\"" << num(y0 + 12)
            << "\" text-anchor=\"end\" font-size=\"11\">" << num(v_max) << "</text>\n";
        svg << "<text x=\"" << num(left - 6) << "\" y=\"" << num(y0 + panel_h)
            << "\" text-anchor=\"end\" font-size=\"11\">" << num(v_min) << "</text>\n";
        svg << "<text x=\"" << num(left + 8) << "\" y=\"" << num(y0 + 16)
            << "\" font-size=\"12\" fill=\"" << panel.color << "\">"
            << xml_escape(panel.label) << "</text>\n";

        // Data polyline(s); a missing sample starts a new segment.
        std::ostringstream pts;
        auto flush = [&] {
            if (pts.tellp() > 0) {
                svg << "<polyline fill=\"none\" stroke=\"" << panel.color
                    << "\" stroke-width=\"1.5\" points=\"" << pts.str() << "\"/>\n";
            }
            pts.str("");
            pts.clear();
        };
        for (const auto& r : series) {
            if (!panel.value(r, v)) { flush(); continue; }
            const double x = left + plot_w * (r.elapsed_seconds / t_max);
            const double y = y0 + panel_h * (1.0 - (v - v_min) / (v_max - v_min));
            pts << num(x) << "," << num(y) << " ";
        }
        flush();
    }

    svg << "<text x=\"" << num(left + plot_w / 2) << "\" y=\"" << num(H - 12)
        << "\" text-anchor=\"middle\" font-size=\"13\">Time (seconds)</text>\n";
    svg << "<text x=\"" << num(left) << "\" y=\"" << num(H - 30)
        << "\" font-size=\"11\">0</text>\n";
    svg << "<text x=\"" << num(left + plot_w) << "\" y=\"" << num(H - 30)
        << "\" text-anchor=\"end\" font-size=\"11\">" << num(t_max) << "</text>\n";
    svg << "</svg>\n";
    return svg.str();
}

// ─── CsvSeriesSink ──────────────────────────────────────────────────────────

Status CsvSeriesSink::render(const std::vector<TimeSeriesRecord>& series) {
    if (path_.empty()) return Status::InvalidParameter;

    // A missing reading is an empty field.
    std::ostringstream out;
    out << "elapsed_seconds,temperature,light_intensity,motion_flag\n";
    double v = 0;
    for (const auto& r : series) {
        out << num(r.elapsed_seconds) << ",";
        if (temperature_of(r, v)) out << num(v);
        out << ",";
        if (light_of(r, v)) out << r.light_intensity;
        out << "," << r.motion_flag << "\n";
    }
    return write_file(path_, out.str()) ? Status::OK : Status::IoError;
}

// ─── FanoutSink ─────────────────────────────────────────────────────────────

std::string FanoutSink::name() const {
    std::string n = "fanout[";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i) n += ",";
        n += sinks_[i]->name();
    }
    return n + "]";
}

Status FanoutSink::render(const std::vector<TimeSeriesRecord>& series) {
    Status first = Status::OK;
    for (auto& s : sinks_) {
        const Status st = s->render(series);
        if (st != Status::OK && first == Status::OK) first = st;
    }
    return first;
}

} // namespace homectl
