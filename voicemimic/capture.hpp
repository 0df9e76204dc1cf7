#pragma once

#include "audio_host.hpp"
#include "buffer.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct LowSignalWarning {
    enum class Reason { NoAudio, LowLevel };
    Reason reason = Reason::NoAudio;
    float peak = 0.0f;
};

struct CaptureResult {
    SampleBuffer audio;
    std::optional<LowSignalWarning> warning; // advisory only
};

// Microphone recorder. Chunks arrive on the driver thread and are kept in
// arrival order until stop().
class AudioCapture {
public:
    AudioCapture(AudioHost& host, const AudioSettings& settings, Logger& log);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void start(const DeviceHandle& device);
    CaptureResult stop();

    bool is_capturing() const { return capturing_.load(); }
    size_t chunk_count() const;

private:
    void on_chunk(const float* interleaved, unsigned long frames, bool overflowed);
    CaptureResult collect();

    AudioHost& host_;
    AudioSettings settings_;
    Logger& log_;

    std::unique_ptr<InputStream> stream_;
    std::atomic<bool> capturing_{false};

    mutable std::mutex chunksMu_;
    std::vector<std::vector<float>> chunks_;
};
