#pragma once

#include <cstddef>
#include <vector>

// Decoded file audio in its native layout.
struct AudioBuffer {
    int sampleRate = 0;
    int channels = 0; // channel 1 for mono and channel 2 for stereo
    std::vector<float> data; // Stereo: [L,R,L,R,...], Mono [M,M,...]

    size_t frame_count() const;
};

// Mono samples, the unit passed between capture, analysis and rendering.
struct SampleBuffer {
    int sampleRate = 0;
    std::vector<float> samples;

    bool empty() const { return samples.empty(); }
    size_t size() const { return samples.size(); }
};

// Collapses channels by averaging each frame.
SampleBuffer to_mono(const AudioBuffer& in);

float peak_amplitude(const std::vector<float>& samples);
