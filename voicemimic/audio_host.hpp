#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct DeviceInfo {
    int index = -1;
    std::string name;
    int maxInputChannels = 0;
    int maxOutputChannels = 0;
    double defaultSampleRate = 0.0;
};

struct DeviceHandle {
    int index = -1;
    std::string name;
};

struct StreamParams {
    int device = -1;
    int channels = 1;
    int sampleRate = 44100;
    unsigned long framesPerBuffer = 1024;
};

// Called on the driver thread with interleaved float frames.
using InputCallback = std::function<void(const float* interleaved, unsigned long frames, bool overflowed)>;

class InputStream {
public:
    virtual ~InputStream() = default;
    virtual void start() = 0;
    // Synchronous: no callback runs after stop() returns.
    virtual void stop() = 0;
};

class OutputStream {
public:
    virtual ~OutputStream() = default;
    virtual void start() = 0;
    // Blocks until the frames are queued to the device.
    virtual void write(const float* interleaved, unsigned long frames) = 0;
    // Drains queued audio.
    virtual void stop() = 0;
    // Discards queued audio and unblocks a pending write(). Callable from any thread.
    virtual void abort() = 0;
};

// Device enumeration and stream factory. PortAudioHost is the real one.
class AudioHost {
public:
    virtual ~AudioHost() = default;

    virtual std::vector<DeviceInfo> devices() const = 0;
    virtual int default_input_device() const = 0;  // -1 when there is none
    virtual int default_output_device() const = 0;

    virtual std::unique_ptr<InputStream> open_input(const StreamParams& params, InputCallback cb) = 0;
    virtual std::unique_ptr<OutputStream> open_output(const StreamParams& params) = 0;
};
