#include "playback.hpp"

#include "devices.hpp"
#include "errors.hpp"
#include "wav.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>


AudioPlayback::AudioPlayback(AudioHost& host, const AudioSettings& settings, Logger& log)
    : host_(host), settings_(settings), log_(log) {}

AudioPlayback::~AudioPlayback() {
    stop();
}

void AudioPlayback::set_output_device(int index) {
    if (playing_.load()) throw PlaybackError("Cannot change output device during playback.");
    output_ = resolve_device(host_.devices(), index, DeviceRole::Output);
    log_.info("Output device set to: " + output_->name);
}

void AudioPlayback::play(AudioBuffer audio) {
    stop();

    if (audio.channels <= 0 || audio.sampleRate <= 0) {
        throw PlaybackError("Cannot play audio with no channels or sample rate.");
    }

    if (!output_) {
        try {
            output_ = select_output_device(host_.devices(), host_.default_output_device());
        } catch (const DeviceError& e) {
            log_.error(std::string("Error selecting output device: ") + e.what());
            throw PlaybackError(e.what());
        }
        log_.info("Using output device: " + output_->name);
    }

    StreamParams params;
    params.device = output_->index;
    params.channels = audio.channels;
    params.sampleRate = audio.sampleRate;
    params.framesPerBuffer = settings_.chunkSize;

    // opened here so device errors reach the caller instead of the thread
    std::shared_ptr<OutputStream> stream;
    try {
        stream = host_.open_output(params);
        stream->start();
    } catch (const std::exception& e) {
        log_.error("Error opening output stream on " + output_->name + ": " + e.what());
        throw PlaybackError(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(errorMu_);
        error_ = nullptr;
    }

    token_ = CancellationToken();
    std::promise<void> done;
    done_ = done.get_future();
    stream_ = stream;
    playing_.store(true);
    try {
        thread_ = std::thread(&AudioPlayback::worker, this, std::move(audio), std::move(stream),
                              token_, std::move(done));
    } catch (const std::system_error& e) {
        playing_.store(false);
        stream_.reset();
        log_.error(std::string("Error starting playback thread: ") + e.what());
        throw PlaybackError(e.what());
    }
}

void AudioPlayback::play_file(const fs::path& path) {
    AudioBuffer audio;
    try {
        audio = load_wav_to_float(path);
    } catch (const std::exception& e) {
        log_.error(std::string("Error during playback: ") + e.what());
        throw;
    }
    play(std::move(audio));
}

void AudioPlayback::worker(AudioBuffer audio, std::shared_ptr<OutputStream> stream,
                           CancellationToken token, std::promise<void> done) {
    try {
        const size_t ch = static_cast<size_t>(audio.channels);
        const size_t total = audio.frame_count();
        size_t frame = 0;

        while (frame < total && !token.cancelled()) {
            const size_t n = std::min<size_t>(settings_.chunkSize, total - frame);
            stream->write(audio.data.data() + frame * ch, static_cast<unsigned long>(n));
            frame += n;
        }

        if (!token.cancelled()) stream->stop();
    } catch (const std::exception& e) {
        // writes fail once the stream was aborted from stop(); that is expected
        if (!token.cancelled()) {
            log_.error(std::string("Error in playback worker: ") + e.what());
            std::lock_guard<std::mutex> lock(errorMu_);
            error_ = std::current_exception();
        }
    }
    playing_.store(false);
    done.set_value();
}

void AudioPlayback::stop() {
    token_.cancel();
    if (thread_.joinable()) {
        if (done_.wait_for(settings_.joinTimeout) != std::future_status::ready) {
            log_.warn("Playback thread did not stop in time; aborting output stream");
            try {
                if (stream_) stream_->abort();
            } catch (const std::exception& e) {
                log_.error(std::string("Error aborting playback: ") + e.what());
            }
        }
        thread_.join();
    }
    stream_.reset();
    playing_.store(false);
}

bool AudioPlayback::wait(std::chrono::milliseconds timeout) {
    if (thread_.joinable()) {
        if (done_.wait_for(timeout) != std::future_status::ready) return false;
        thread_.join();
        stream_.reset();
    }

    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lock(errorMu_);
        std::swap(err, error_);
    }
    if (err) std::rethrow_exception(err);
    return true;
}
