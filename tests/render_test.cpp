#include "voicemimic/errors.hpp"
#include "voicemimic/features.hpp"
#include "voicemimic/render.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace {

FeatureBundle bundle_of(size_t n, float amplitude) {
    SampleBuffer s;
    s.sampleRate = 44100;
    s.samples.resize(n);
    for (size_t i = 0; i < n; i++) s.samples[i] = amplitude * std::sin(static_cast<float>(i) * 0.05f);
    return extract_features(s, 256);
}

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) n++;
    return n;
}

} // namespace

TEST(Render, DifferentLengthsBothSpanUnitTime) {
    RenderedFigure fig = render(bundle_of(1000, 0.5f), bundle_of(2500, 0.8f));

    ASSERT_EQ(fig.panels.size(), 3u);
    for (const Panel& p : fig.panels) {
        for (const Series* s : {&p.reference, &p.attempt}) {
            ASSERT_FALSE(s->x.empty());
            EXPECT_DOUBLE_EQ(s->x.front(), 0.0);
            EXPECT_DOUBLE_EQ(s->x.back(), 1.0);
            EXPECT_EQ(s->x.size(), s->y.size());
            EXPECT_TRUE(std::is_sorted(s->x.begin(), s->x.end()));
        }
    }
    EXPECT_EQ(fig.panels[kWaveformPanel].reference.x.size(), 1000u);
    EXPECT_EQ(fig.panels[kWaveformPanel].attempt.x.size(), 2500u);
    EXPECT_EQ(fig.panels[kEnvelopePanel].reference.x.size(), 4u);  // ceil(1000/256)
    EXPECT_EQ(fig.panels[kEnvelopePanel].attempt.x.size(), 10u);   // ceil(2500/256)
}

TEST(Render, PanelsAreWaveformEnvelopeEnergy) {
    RenderedFigure fig = render(bundle_of(1000, 0.5f), bundle_of(2500, 0.8f));
    EXPECT_EQ(fig.panels[kWaveformPanel].title, "Waveform Comparison");
    EXPECT_EQ(fig.panels[kEnvelopePanel].title, "Amplitude Envelope");
    EXPECT_EQ(fig.panels[kEnergyPanel].title, "Energy Contour");
    EXPECT_EQ(fig.panels[kEnergyPanel].reference.label, "Reference");
    EXPECT_EQ(fig.panels[kEnergyPanel].attempt.label, "Your Attempt");
}

TEST(Render, EnergyIsScaledToItsOwnPeak) {
    RenderedFigure fig = render(bundle_of(3000, 0.1f), bundle_of(3000, 0.9f));
    const Panel& energy = fig.panels[kEnergyPanel];
    for (const Series* s : {&energy.reference, &energy.attempt}) {
        EXPECT_DOUBLE_EQ(*std::max_element(s->y.begin(), s->y.end()), 1.0);
        for (double v : s->y) EXPECT_GE(v, 0.0);
    }
    // envelope keeps absolute scale
    const Panel& env = fig.panels[kEnvelopePanel];
    EXPECT_LT(*std::max_element(env.reference.y.begin(), env.reference.y.end()), 0.11);
}

TEST(Render, SilentAttemptDoesNotProduceNaN) {
    FeatureBundle silent = extract_features(SampleBuffer{44100, std::vector<float>(500, 0.0f)}, 256);
    RenderedFigure fig = render(bundle_of(1000, 0.5f), silent);
    for (double v : fig.panels[kEnergyPanel].attempt.y) EXPECT_EQ(v, 0.0);
}

TEST(Render, EmptyWaveformThrows) {
    FeatureBundle empty;
    EXPECT_THROW(render(empty, bundle_of(100, 0.5f)), EmptySeriesError);
    EXPECT_THROW(render(bundle_of(100, 0.5f), empty), EmptySeriesError);
}

TEST(Render, SingleSampleSitsAtZero) {
    RenderedFigure fig = render(bundle_of(1, 0.5f), bundle_of(2, 0.5f));
    EXPECT_EQ(fig.panels[kWaveformPanel].reference.x, (std::vector<double>{0.0}));
    EXPECT_EQ(fig.panels[kWaveformPanel].attempt.x, (std::vector<double>{0.0, 1.0}));
}

TEST(RenderSvg, HasThreePanelsWithTwoSeriesEach) {
    PlotSettings plot;
    std::string svg = render_svg(render(bundle_of(1000, 0.5f), bundle_of(100000, 0.8f)), plot);

    EXPECT_EQ(svg.rfind("<svg", 0), 0u);
    EXPECT_NE(svg.find("width=\"1000\" height=\"600\""), std::string::npos);
    EXPECT_EQ(count_of(svg, "<polyline"), 6u);
    EXPECT_NE(svg.find("Voice Comparison Visualization"), std::string::npos);
    EXPECT_NE(svg.find("Energy Contour"), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
    EXPECT_EQ(svg.find("nan"), std::string::npos);
}

TEST(RenderSvg, LongSeriesAreDecimated) {
    PlotSettings plot;
    std::string svg = render_svg(render(bundle_of(1000, 0.5f), bundle_of(500000, 0.5f)), plot);
    // at most two points per pixel column, far below one per sample
    EXPECT_LT(svg.size(), 200000u);
}

TEST(NormalizedTimeAxis, Endpoints) {
    EXPECT_TRUE(normalized_time_axis(0).empty());
    std::vector<double> x = normalized_time_axis(5);
    EXPECT_EQ(x, (std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}));
}
