#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace fs = std::filesystem;

struct AudioSettings {
    int sampleRate = 44100;
    int channels = 1;                     // recordings are mono
    unsigned long chunkSize = 1024;       // frames per buffer, capture and playback
    std::chrono::milliseconds joinTimeout{1000};
    float lowSignalThreshold = 0.01f;     // peak below this triggers a warning
};

struct AnalysisSettings {
    size_t frameSize = 2048;              // envelope / energy window
    size_t trimFrameLength = 2048;
    size_t trimHopLength = 512;
    double trimTopDb = 20.0;
    bool trimBeforeCompare = false;
};

struct PlotSettings {
    double widthInches = 10.0;
    double heightInches = 6.0;
    int dpi = 100;

    int width_px() const { return static_cast<int>(widthInches * dpi); }
    int height_px() const { return static_cast<int>(heightInches * dpi); }
};

struct Config {
    AudioSettings audio;
    AnalysisSettings analysis;
    PlotSettings plot;

    fs::path baseDir = ".";
    int inputDevice = -1;                 // -1: pick by policy
    int outputDevice = -1;                // -1: pick lazily on first playback

    fs::path references_dir() const { return baseDir / "references"; }
    fs::path temp_dir() const { return baseDir / "temp"; }
    fs::path recordings_dir() const { return baseDir / "user_recordings"; }
};

// Throws std::invalid_argument describing the first bad field.
void validate(const Config& cfg);

// Creates the references, temp and user-recordings directories.
void ensure_directories(const Config& cfg);
