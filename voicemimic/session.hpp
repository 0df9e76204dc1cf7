#pragma once

#include "audio_host.hpp"
#include "capture.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "playback.hpp"
#include "render.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Sorted stems of the *.wav files in dir.
std::vector<std::string> list_references(const fs::path& dir);

// <dir>/attempt_<N>.wav, N = number of wav files in dir + 1, bumped until unused.
fs::path next_attempt_path(const fs::path& dir);

// Load both files, extract features and build the comparison figure.
RenderedFigure compare_recordings(const fs::path& reference, const fs::path& attempt,
                                  const Config& cfg, Logger& log);

// One training session against the recordings under cfg.baseDir:
// listen -> record -> playback -> visualize.
class Session {
public:
    Session(AudioHost& host, const Config& cfg, Logger& log);

    const DeviceHandle& input_device() const { return input_; }
    void set_input_device(int index);

    fs::path reference_path(const std::string& name) const;

    void listen(const std::string& reference);
    void start_recording();
    fs::path stop_recording();
    void play_attempt();

    // Writes <temp>/<reference>_comparison.svg and returns its path.
    fs::path visualize(const std::string& reference);

    // Use an existing file as the current attempt instead of recording one.
    void set_attempt(const fs::path& path);
    const std::optional<fs::path>& attempt() const { return attempt_; }

    bool is_recording() const { return capture_.is_capturing(); }
    AudioPlayback& playback() { return playback_; }
    const std::optional<LowSignalWarning>& last_warning() const { return lastWarning_; }

private:
    AudioHost& host_;
    Config cfg_;
    Logger& log_;

    DeviceHandle input_;
    AudioCapture capture_;
    AudioPlayback playback_;

    std::optional<fs::path> attempt_;
    std::optional<LowSignalWarning> lastWarning_;
};
