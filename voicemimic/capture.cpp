#include "capture.hpp"

#include "devices.hpp"
#include "errors.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>


AudioCapture::AudioCapture(AudioHost& host, const AudioSettings& settings, Logger& log)
    : host_(host), settings_(settings), log_(log) {}

AudioCapture::~AudioCapture() {
    if (!stream_) return;
    capturing_.store(false);
    try {
        stream_->stop();
    } catch (const std::exception& e) {
        log_.error(std::string("Error closing capture stream: ") + e.what());
    }
}

void AudioCapture::start(const DeviceHandle& device) {
    if (capturing_.load() || stream_) throw CaptureError("Capture already in progress.");

    // throws DeviceError when the index is gone or cannot record
    DeviceHandle dev = resolve_device(host_.devices(), device.index, DeviceRole::Input);

    {
        std::lock_guard<std::mutex> lock(chunksMu_);
        chunks_.clear();
    }

    StreamParams params;
    params.device = dev.index;
    params.channels = settings_.channels;
    params.sampleRate = settings_.sampleRate;
    params.framesPerBuffer = settings_.chunkSize;

    try {
        stream_ = host_.open_input(params, [this](const float* in, unsigned long frames, bool overflowed) {
            on_chunk(in, frames, overflowed);
        });
        capturing_.store(true);
        stream_->start();
    } catch (const std::exception& e) {
        capturing_.store(false);
        stream_.reset();
        log_.error("Error starting recording on " + dev.name + ": " + e.what());
        throw;
    }
    log_.info("Recording from " + dev.name);
}

CaptureResult AudioCapture::stop() {
    capturing_.store(false);
    if (stream_) {
        try {
            stream_->stop();
        } catch (const std::exception& e) {
            stream_.reset();
            log_.error(std::string("Error stopping recording: ") + e.what());
            throw;
        }
        stream_.reset();
    }
    return collect();
}

size_t AudioCapture::chunk_count() const {
    std::lock_guard<std::mutex> lock(chunksMu_);
    return chunks_.size();
}

void AudioCapture::on_chunk(const float* interleaved, unsigned long frames, bool overflowed) {
    if (overflowed) log_.warn("Input overflow reported by the audio driver");
    if (!capturing_.load()) return;

    const size_t n = static_cast<size_t>(frames) * static_cast<size_t>(settings_.channels);
    std::lock_guard<std::mutex> lock(chunksMu_);
    chunks_.emplace_back(interleaved, interleaved + n);
}

CaptureResult AudioCapture::collect() {
    std::vector<std::vector<float>> chunks;
    {
        std::lock_guard<std::mutex> lock(chunksMu_);
        chunks.swap(chunks_);
    }

    CaptureResult result;
    result.audio.sampleRate = settings_.sampleRate;

    if (chunks.empty()) {
        log_.warn("No audio frames were captured!");
        result.warning = LowSignalWarning{LowSignalWarning::Reason::NoAudio, 0.0f};
        return result;
    }

    AudioBuffer raw;
    raw.sampleRate = settings_.sampleRate;
    raw.channels = settings_.channels;
    size_t total = 0;
    for (const auto& c : chunks) total += c.size();
    raw.data.reserve(total);
    for (const auto& c : chunks) raw.data.insert(raw.data.end(), c.begin(), c.end());

    result.audio = to_mono(raw);

    const float peak = peak_amplitude(result.audio.samples);
    if (peak < settings_.lowSignalThreshold) {
        std::ostringstream os;
        os << "Very low audio levels detected! (peak " << peak << ")";
        log_.warn(os.str());
        result.warning = LowSignalWarning{LowSignalWarning::Reason::LowLevel, peak};
    }

    log_.debug("Captured " + std::to_string(chunks.size()) + " chunks, " +
               std::to_string(result.audio.size()) + " samples");
    return result;
}
