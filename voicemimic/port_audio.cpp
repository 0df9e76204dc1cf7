#include "port_audio.hpp"

#include "errors.hpp"

#include <portaudio.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string pa_error(const char* what, PaError err) {
    return std::string(what) + " failed: " + Pa_GetErrorText(err);
}

class PaInputStream : public InputStream {
public:
    PaInputStream(const StreamParams& params, InputCallback cb)
        : cb_(std::move(cb)) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(params.device);
        if (!info) throw DeviceError("No such audio device: " + std::to_string(params.device));

        PaStreamParameters in{};
        in.device = params.device;
        in.channelCount = params.channels;
        in.sampleFormat = paFloat32;
        in.suggestedLatency = info->defaultLowInputLatency;
        in.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&stream_, &in, nullptr, params.sampleRate,
                                    params.framesPerBuffer, paClipOff, pa_callback, this);
        if (err != paNoError) throw CaptureError(pa_error("Pa_OpenStream (input)", err));
    }

    ~PaInputStream() override {
        if (stream_) Pa_CloseStream(stream_);
    }

    void start() override {
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) throw CaptureError(pa_error("Pa_StartStream (input)", err));
    }

    void stop() override {
        if (Pa_IsStreamStopped(stream_) == 1) return;
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) throw CaptureError(pa_error("Pa_StopStream (input)", err));
    }

private:
    static int pa_callback(const void* inputBuffer, void*,
                           unsigned long framesPerBuffer,
                           const PaStreamCallbackTimeInfo*,
                           PaStreamCallbackFlags statusFlags,
                           void* userData)
    {
        auto* self = static_cast<PaInputStream*>(userData);
        if (inputBuffer) {
            self->cb_(static_cast<const float*>(inputBuffer), framesPerBuffer,
                      (statusFlags & paInputOverflow) != 0);
        }
        return paContinue;
    }

    InputCallback cb_;
    PaStream* stream_ = nullptr;
};

class PaOutputStream : public OutputStream {
public:
    explicit PaOutputStream(const StreamParams& params) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(params.device);
        if (!info) throw PlaybackError("No such audio device: " + std::to_string(params.device));
        if (info->maxOutputChannels <= 0) {
            throw PlaybackError(std::string("Device has no output channels: ") + info->name);
        }

        PaStreamParameters out{};
        out.device = params.device;
        out.channelCount = params.channels;
        out.sampleFormat = paFloat32;
        out.suggestedLatency = info->defaultHighOutputLatency;
        out.hostApiSpecificStreamInfo = nullptr;

        // no callback: blocking writes from the playback thread
        PaError err = Pa_OpenStream(&stream_, nullptr, &out, params.sampleRate,
                                    params.framesPerBuffer, paClipOff, nullptr, nullptr);
        if (err != paNoError) throw PlaybackError(pa_error("Pa_OpenStream (output)", err));
    }

    ~PaOutputStream() override {
        if (stream_) Pa_CloseStream(stream_);
    }

    void start() override {
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) throw PlaybackError(pa_error("Pa_StartStream (output)", err));
    }

    void write(const float* interleaved, unsigned long frames) override {
        PaError err = Pa_WriteStream(stream_, interleaved, frames);
        // an underflow only means we were late; the data is still queued
        if (err != paNoError && err != paOutputUnderflowed) {
            throw PlaybackError(pa_error("Pa_WriteStream", err));
        }
    }

    void stop() override {
        if (Pa_IsStreamStopped(stream_) == 1) return;
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) throw PlaybackError(pa_error("Pa_StopStream", err));
    }

    void abort() override {
        if (Pa_IsStreamStopped(stream_) == 1) return;
        PaError err = Pa_AbortStream(stream_);
        if (err != paNoError) throw PlaybackError(pa_error("Pa_AbortStream", err));
    }

private:
    PaStream* stream_ = nullptr;
};

} // namespace

PortAudioHost::PortAudioHost() {
    PaError err = Pa_Initialize();
    if (err != paNoError) throw std::runtime_error(pa_error("Pa_Initialize", err));
}

PortAudioHost::~PortAudioHost() {
    Pa_Terminate();
}

std::vector<DeviceInfo> PortAudioHost::devices() const {
    int count = Pa_GetDeviceCount();
    if (count < 0) throw DeviceError(pa_error("Pa_GetDeviceCount", count));

    std::vector<DeviceInfo> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        DeviceInfo d;
        d.index = i;
        d.name = info->name ? info->name : "";
        d.maxInputChannels = info->maxInputChannels;
        d.maxOutputChannels = info->maxOutputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        out.push_back(std::move(d));
    }
    return out;
}

int PortAudioHost::default_input_device() const {
    PaDeviceIndex idx = Pa_GetDefaultInputDevice();
    return idx == paNoDevice ? -1 : idx;
}

int PortAudioHost::default_output_device() const {
    PaDeviceIndex idx = Pa_GetDefaultOutputDevice();
    return idx == paNoDevice ? -1 : idx;
}

std::unique_ptr<InputStream> PortAudioHost::open_input(const StreamParams& params, InputCallback cb) {
    return std::make_unique<PaInputStream>(params, std::move(cb));
}

std::unique_ptr<OutputStream> PortAudioHost::open_output(const StreamParams& params) {
    return std::make_unique<PaOutputStream>(params);
}
