#pragma once

#include "audio_host.hpp"
#include "buffer.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

// Shared stop flag handed to one playback task.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// At most one playback at a time. play() returns immediately; audio is
// written from a background thread that checks its token between chunks.
class AudioPlayback {
public:
    AudioPlayback(AudioHost& host, const AudioSettings& settings, Logger& log);
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    void set_output_device(int index);
    std::optional<DeviceHandle> output_device() const { return output_; }

    void play(AudioBuffer audio);
    void play_file(const fs::path& path);

    // Cancel, wait up to joinTimeout, then abort the stream and join.
    void stop();

    // Waits for the current playback to finish on its own. Returns false on
    // timeout. Rethrows an error raised by the playback thread.
    bool wait(std::chrono::milliseconds timeout);

    bool is_playing() const { return playing_.load(); }

private:
    void worker(AudioBuffer audio, std::shared_ptr<OutputStream> stream,
                CancellationToken token, std::promise<void> done);

    AudioHost& host_;
    AudioSettings settings_;
    Logger& log_;

    std::optional<DeviceHandle> output_;

    std::thread thread_;
    std::shared_ptr<OutputStream> stream_;
    CancellationToken token_;
    std::future<void> done_;
    std::atomic<bool> playing_{false};

    std::mutex errorMu_;
    std::exception_ptr error_;
};
