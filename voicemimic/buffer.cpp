#include "buffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>


size_t AudioBuffer::frame_count() const {
    if (channels <= 0) return 0;
    return data.size() / static_cast<size_t>(channels);
}

SampleBuffer to_mono(const AudioBuffer& in) {
    SampleBuffer out;
    out.sampleRate = in.sampleRate;
    if (in.channels <= 1) {
        out.samples = in.data;
        return out;
    }

    const size_t frames = in.frame_count();
    const size_t ch = static_cast<size_t>(in.channels);
    out.samples.resize(frames);
    for (size_t f = 0; f < frames; f++) {
        float sum = 0.0f;
        for (size_t c = 0; c < ch; c++) sum += in.data[f * ch + c];
        out.samples[f] = sum / static_cast<float>(ch);
    }
    return out;
}

float peak_amplitude(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}
