#pragma once

#include "audio_host.hpp"

#include <memory>
#include <vector>

// Owns Pa_Initialize/Pa_Terminate. Streams it opens must not outlive it.
class PortAudioHost : public AudioHost {
public:
    PortAudioHost();
    ~PortAudioHost() override;

    PortAudioHost(const PortAudioHost&) = delete;
    PortAudioHost& operator=(const PortAudioHost&) = delete;

    std::vector<DeviceInfo> devices() const override;
    int default_input_device() const override;
    int default_output_device() const override;

    std::unique_ptr<InputStream> open_input(const StreamParams& params, InputCallback cb) override;
    std::unique_ptr<OutputStream> open_output(const StreamParams& params) override;
};
