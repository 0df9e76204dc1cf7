#pragma once

#include "buffer.hpp"
#include "logger.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

constexpr size_t kDefaultFrameSize = 2048;

// Per-frame series derived from one recording, used for plotting only.
struct FeatureBundle {
    int sampleRate = 0;
    size_t frameSize = kDefaultFrameSize;
    std::vector<float> waveform;
    std::vector<float> envelope; // max |x| per frame
    std::vector<float> energy;   // sum x^2 per frame
};

// Frames are non-overlapping; the last one may be shorter.
std::vector<float> compute_envelope(const std::vector<float>& samples, size_t frameSize = kDefaultFrameSize);
std::vector<float> compute_energy(const std::vector<float>& samples, size_t frameSize = kDefaultFrameSize);

// Peak becomes 1.0. Throws DegenerateSignalError for empty or all-zero input.
std::vector<float> normalize(const std::vector<float>& samples);

// Drops leading and trailing frames more than topDb below the loudest frame.
// Interior silence is kept.
std::vector<float> trim_silence(const std::vector<float>& samples, double topDb = 20.0,
                                size_t frameLength = 2048, size_t hopLength = 512);

// Truncates or zero-pads source to target.size(). No time alignment.
std::vector<float> match_length(const std::vector<float>& source, const std::vector<float>& target);

FeatureBundle extract_features(const SampleBuffer& audio, size_t frameSize = kDefaultFrameSize);

// Loads a WAV file as mono. A rate other than expectedRate is logged, not resampled.
SampleBuffer load_audio(const fs::path& path, int expectedRate, Logger& log);
