#pragma once

#include "config.hpp"
#include "features.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Series {
    std::string label;
    std::string color; // any SVG colour
    std::vector<double> x; // normalised time, 0..1
    std::vector<double> y;
};

struct Panel {
    std::string title;
    std::string xLabel;
    std::string yLabel;
    Series reference;
    Series attempt;
};

enum PanelKind { kWaveformPanel = 0, kEnvelopePanel = 1, kEnergyPanel = 2 };

struct RenderedFigure {
    std::string title;
    std::array<Panel, 3> panels;
};

// Each series is stretched to unit duration independently, so shapes are
// compared rather than absolute timing. Energy is scaled to its own peak.
// Throws EmptySeriesError when either waveform is empty.
RenderedFigure render(const FeatureBundle& reference, const FeatureBundle& attempt);

// i / (n - 1) for n > 1, a single 0 for n == 1.
std::vector<double> normalized_time_axis(size_t n);

std::string render_svg(const RenderedFigure& fig, const PlotSettings& plot);
void write_svg(const RenderedFigure& fig, const fs::path& path, const PlotSettings& plot);
