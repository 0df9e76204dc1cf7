#include "render.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

const char* kReferenceColor = "#1f4fd1";
const char* kAttemptColor = "#d62728";

Series make_series(std::string label, const char* color, const std::vector<float>& values) {
    Series s;
    s.label = std::move(label);
    s.color = color;
    s.x = normalized_time_axis(values.size());
    s.y.assign(values.begin(), values.end());
    return s;
}

void scale_to_peak(std::vector<double>& y) {
    double peak = 0.0;
    for (double v : y) peak = std::max(peak, v);
    // silent recordings keep a flat zero line
    if (peak <= 0.0) return;
    for (double& v : y) v /= peak;
}

Panel make_panel(const char* title, const char* yLabel,
                 const std::vector<float>& ref, const std::vector<float>& att) {
    Panel p;
    p.title = title;
    p.xLabel = "Time (normalized)";
    p.yLabel = yLabel;
    p.reference = make_series("Reference", kReferenceColor, ref);
    p.attempt = make_series("Your Attempt", kAttemptColor, att);
    return p;
}

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

struct Rect {
    double x, y, w, h;
};

// Min/max per pixel column once a series has more points than columns.
std::vector<std::pair<double, double>> decimate(const Series& s, int columns) {
    std::vector<std::pair<double, double>> pts;
    const size_t n = std::min(s.x.size(), s.y.size());
    if (columns <= 0 || n <= static_cast<size_t>(columns) * 2) {
        pts.reserve(n);
        for (size_t i = 0; i < n; i++) pts.emplace_back(s.x[i], s.y[i]);
        return pts;
    }

    pts.reserve(static_cast<size_t>(columns) * 2);
    size_t i = 0;
    for (int col = 0; col < columns && i < n; col++) {
        const double colEnd = static_cast<double>(col + 1) / columns;
        double lo = s.y[i], hi = s.y[i];
        size_t loAt = i, hiAt = i;
        while (i < n && (s.x[i] < colEnd || col == columns - 1)) {
            if (s.y[i] < lo) { lo = s.y[i]; loAt = i; }
            if (s.y[i] > hi) { hi = s.y[i]; hiAt = i; }
            i++;
        }
        // keep temporal order inside the column
        if (loAt <= hiAt) {
            pts.emplace_back(s.x[loAt], lo);
            if (hiAt != loAt) pts.emplace_back(s.x[hiAt], hi);
        } else {
            pts.emplace_back(s.x[hiAt], hi);
            pts.emplace_back(s.x[loAt], lo);
        }
    }
    return pts;
}

void y_range(const Panel& p, double& lo, double& hi) {
    lo = std::numeric_limits<double>::max();
    hi = std::numeric_limits<double>::lowest();
    for (const Series* s : {&p.reference, &p.attempt}) {
        for (double v : s->y) {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    if (lo > hi) { lo = 0.0; hi = 1.0; }
    if (hi - lo < 1e-12) { lo -= 0.5; hi += 0.5; }
    const double pad = (hi - lo) * 0.05;
    lo -= pad;
    hi += pad;
}

void draw_panel(std::ostringstream& os, const Panel& p, const Rect& r) {
    double lo = 0.0, hi = 1.0;
    y_range(p, lo, hi);

    auto px = [&](double x) { return r.x + x * r.w; };
    auto py = [&](double y) { return r.y + r.h - (y - lo) / (hi - lo) * r.h; };

    os << "<g>\n";
    os << "<text x=\"" << r.x + r.w / 2 << "\" y=\"" << r.y - 8
       << "\" text-anchor=\"middle\" font-size=\"13\">" << xml_escape(p.title) << "</text>\n";
    os << "<rect x=\"" << r.x << "\" y=\"" << r.y << "\" width=\"" << r.w << "\" height=\"" << r.h
       << "\" fill=\"none\" stroke=\"#333\" stroke-width=\"1\"/>\n";

    // grid and tick labels
    for (int i = 0; i <= 4; i++) {
        const double t = i / 4.0;
        const double gx = px(t);
        const double gy = r.y + r.h - t * r.h;
        const double yv = lo + t * (hi - lo);
        os << "<line x1=\"" << gx << "\" y1=\"" << r.y << "\" x2=\"" << gx << "\" y2=\"" << r.y + r.h
           << "\" stroke=\"#000\" stroke-opacity=\"0.15\"/>\n";
        os << "<line x1=\"" << r.x << "\" y1=\"" << gy << "\" x2=\"" << r.x + r.w << "\" y2=\"" << gy
           << "\" stroke=\"#000\" stroke-opacity=\"0.15\"/>\n";
        os << "<text x=\"" << gx << "\" y=\"" << r.y + r.h + 14
           << "\" text-anchor=\"middle\" font-size=\"10\">" << std::setprecision(2) << t
           << std::setprecision(1) << "</text>\n";
        os << "<text x=\"" << r.x - 6 << "\" y=\"" << gy + 3
           << "\" text-anchor=\"end\" font-size=\"10\">" << std::setprecision(3) << yv
           << std::setprecision(1) << "</text>\n";
    }

    os << "<text x=\"" << r.x + r.w / 2 << "\" y=\"" << r.y + r.h + 28
       << "\" text-anchor=\"middle\" font-size=\"11\">" << xml_escape(p.xLabel) << "</text>\n";
    os << "<text x=\"" << r.x - 50 << "\" y=\"" << r.y + r.h / 2
       << "\" text-anchor=\"middle\" font-size=\"11\" transform=\"rotate(-90 " << r.x - 50 << " "
       << r.y + r.h / 2 << ")\">" << xml_escape(p.yLabel) << "</text>\n";

    const int columns = static_cast<int>(r.w);
    for (const Series* s : {&p.reference, &p.attempt}) {
        std::vector<std::pair<double, double>> pts = decimate(*s, columns);
        if (pts.empty()) continue;
        os << "<polyline fill=\"none\" stroke=\"" << s->color << "\" stroke-width=\"1\""
           << (s == &p.reference ? " stroke-opacity=\"0.7\"" : " stroke-opacity=\"0.6\"") << " points=\"";
        for (const auto& pt : pts) os << px(pt.first) << "," << py(pt.second) << " ";
        os << "\"/>\n";
    }

    // legend, top right
    const double lx = r.x + r.w - 120;
    double ly = r.y + 14;
    for (const Series* s : {&p.reference, &p.attempt}) {
        os << "<line x1=\"" << lx << "\" y1=\"" << ly - 4 << "\" x2=\"" << lx + 20 << "\" y2=\"" << ly - 4
           << "\" stroke=\"" << s->color << "\" stroke-width=\"2\"/>\n";
        os << "<text x=\"" << lx + 26 << "\" y=\"" << ly << "\" font-size=\"10\">" << xml_escape(s->label)
           << "</text>\n";
        ly += 14;
    }
    os << "</g>\n";
}

} // namespace

std::vector<double> normalized_time_axis(size_t n) {
    std::vector<double> x(n);
    if (n == 1) return {0.0};
    for (size_t i = 0; i < n; i++) x[i] = static_cast<double>(i) / static_cast<double>(n - 1);
    return x;
}

RenderedFigure render(const FeatureBundle& reference, const FeatureBundle& attempt) {
    if (reference.waveform.empty()) throw EmptySeriesError("reference waveform is empty");
    if (attempt.waveform.empty()) throw EmptySeriesError("attempt waveform is empty");

    RenderedFigure fig;
    fig.title = "Voice Comparison Visualization";
    fig.panels[kWaveformPanel] = make_panel("Waveform Comparison", "Amplitude",
                                            reference.waveform, attempt.waveform);
    fig.panels[kEnvelopePanel] = make_panel("Amplitude Envelope", "Envelope",
                                            reference.envelope, attempt.envelope);
    fig.panels[kEnergyPanel] = make_panel("Energy Contour", "Normalized Energy",
                                          reference.energy, attempt.energy);
    scale_to_peak(fig.panels[kEnergyPanel].reference.y);
    scale_to_peak(fig.panels[kEnergyPanel].attempt.y);
    return fig;
}

std::string render_svg(const RenderedFigure& fig, const PlotSettings& plot) {
    const double w = plot.width_px();
    const double h = plot.height_px();

    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "<svg width=\"" << plot.width_px() << "\" height=\"" << plot.height_px()
       << "\" xmlns=\"http://www.w3.org/2000/svg\" font-family=\"sans-serif\">\n";
    os << "<rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n";
    os << "<text x=\"" << w / 2 << "\" y=\"24\" text-anchor=\"middle\" font-size=\"16\">"
       << xml_escape(fig.title) << "</text>\n";

    const double top = 40.0, left = 80.0, right = 20.0;
    const double slot = (h - top) / fig.panels.size();
    for (size_t i = 0; i < fig.panels.size(); i++) {
        // room for the panel title above and the axis label below
        Rect r{left, top + i * slot + 20.0, w - left - right, slot - 56.0};
        if (r.w <= 0 || r.h <= 0) continue;
        draw_panel(os, fig.panels[i], r);
    }

    os << "</svg>\n";
    return os.str();
}

void write_svg(const RenderedFigure& fig, const fs::path& path, const PlotSettings& plot) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open for writing: " + path.string());
    out << render_svg(fig, plot);
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}
