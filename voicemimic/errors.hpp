#pragma once

#include <stdexcept>
#include <string>

// No such device, or the device lacks the requested direction.
struct DeviceError : std::runtime_error {
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

struct CaptureError : std::runtime_error {
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

struct PlaybackError : std::runtime_error {
    explicit PlaybackError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed or unsupported RIFF/WAVE data, or a file that cannot be opened.
struct WavError : std::runtime_error {
    explicit WavError(const std::string& what) : std::runtime_error(what) {}
};

struct EmptySeriesError : std::runtime_error {
    explicit EmptySeriesError(const std::string& what) : std::runtime_error(what) {}
};

struct DegenerateSignalError : std::runtime_error {
    explicit DegenerateSignalError(const std::string& what) : std::runtime_error(what) {}
};
