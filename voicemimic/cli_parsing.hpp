#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace fs = std::filesystem;

struct Options {
    std::optional<std::string> reference;
    std::optional<fs::path> attempt;
    bool listReferences = false;
    bool listDevices = false;

    fs::path baseDir = ".";
    std::optional<int> inputDevice;
    std::optional<int> outputDevice;
    std::optional<int> sampleRate;
    std::optional<size_t> frameSize;

    bool listen = true;
    bool playback = false;
    bool trim = false;
    bool verbose = false;
};

void usage(const char* argv0, std::ostream& os);

// Throws std::runtime_error on unknown flags, missing values or a missing --reference.
Options parse_args(int argc, char** argv);

Config to_config(const Options& opt);
