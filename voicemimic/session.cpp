#include "session.hpp"

#include "devices.hpp"
#include "errors.hpp"
#include "features.hpp"
#include "wav.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

bool is_wav(const fs::directory_entry& e) {
    return e.is_regular_file() && e.path().extension() == ".wav";
}

} // namespace

std::vector<std::string> list_references(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    for (const auto& e : fs::directory_iterator(dir)) {
        if (is_wav(e)) names.push_back(e.path().stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

fs::path next_attempt_path(const fs::path& dir) {
    size_t existing = 0;
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        for (const auto& e : fs::directory_iterator(dir)) {
            if (is_wav(e)) existing++;
        }
    }

    size_t n = existing + 1;
    fs::path p = dir / ("attempt_" + std::to_string(n) + ".wav");
    while (fs::exists(p)) {
        p = dir / ("attempt_" + std::to_string(++n) + ".wav");
    }
    return p;
}

RenderedFigure compare_recordings(const fs::path& reference, const fs::path& attempt,
                                  const Config& cfg, Logger& log) {
    SampleBuffer ref = load_audio(reference, cfg.audio.sampleRate, log);
    SampleBuffer att = load_audio(attempt, cfg.audio.sampleRate, log);

    if (cfg.analysis.trimBeforeCompare) {
        const AnalysisSettings& a = cfg.analysis;
        ref.samples = trim_silence(ref.samples, a.trimTopDb, a.trimFrameLength, a.trimHopLength);
        att.samples = trim_silence(att.samples, a.trimTopDb, a.trimFrameLength, a.trimHopLength);
    }

    FeatureBundle refFeatures = extract_features(ref, cfg.analysis.frameSize);
    FeatureBundle attFeatures = extract_features(att, cfg.analysis.frameSize);
    log.debug("reference: " + std::to_string(refFeatures.waveform.size()) + " samples, " +
              std::to_string(refFeatures.envelope.size()) + " frames; attempt: " +
              std::to_string(attFeatures.waveform.size()) + " samples, " +
              std::to_string(attFeatures.envelope.size()) + " frames");

    return render(refFeatures, attFeatures);
}

Session::Session(AudioHost& host, const Config& cfg, Logger& log)
    : host_(host), cfg_(cfg), log_(log),
      capture_(host, cfg.audio, log), playback_(host, cfg.audio, log) {
    validate(cfg_);
    ensure_directories(cfg_);

    std::vector<DeviceInfo> all = host_.devices();
    if (cfg_.inputDevice >= 0) {
        input_ = resolve_device(all, cfg_.inputDevice, DeviceRole::Input);
    } else {
        input_ = select_input_device(all, host_.default_input_device());
    }
    log_.info("Using input device: " + input_.name);

    if (cfg_.outputDevice >= 0) playback_.set_output_device(cfg_.outputDevice);
}

void Session::set_input_device(int index) {
    if (capture_.is_capturing()) throw CaptureError("Cannot change input device while recording.");
    try {
        input_ = resolve_device(host_.devices(), index, DeviceRole::Input);
    } catch (const DeviceError& e) {
        log_.error(std::string("Error setting input device: ") + e.what());
        throw;
    }
    log_.info("Input device set to: " + input_.name);
}

fs::path Session::reference_path(const std::string& name) const {
    fs::path p = cfg_.references_dir() / (name + ".wav");
    if (!fs::exists(p)) throw std::runtime_error("Reference file not found: " + p.string());
    return p;
}

void Session::listen(const std::string& reference) {
    playback_.play_file(reference_path(reference));
}

void Session::start_recording() {
    lastWarning_.reset();
    capture_.start(input_);
}

fs::path Session::stop_recording() {
    CaptureResult result = capture_.stop();
    lastWarning_ = result.warning;

    if (result.audio.empty()) {
        log_.error("No audio data to save");
        throw CaptureError("No audio data to save");
    }

    fs::path path = next_attempt_path(cfg_.recordings_dir());
    try {
        save_wav_float(path, result.audio);
    } catch (const std::exception& e) {
        log_.error(std::string("Error saving recording: ") + e.what());
        throw;
    }
    attempt_ = path;
    log_.info("Recording saved to " + path.string());
    return path;
}

void Session::play_attempt() {
    if (!attempt_ || !fs::exists(*attempt_)) throw std::runtime_error("No recording available to play back.");
    playback_.play_file(*attempt_);
}

fs::path Session::visualize(const std::string& reference) {
    if (!attempt_ || !fs::exists(*attempt_)) throw std::runtime_error("No recording available to visualize.");

    RenderedFigure fig = compare_recordings(reference_path(reference), *attempt_, cfg_, log_);
    fs::path out = cfg_.temp_dir() / (reference + "_comparison.svg");
    write_svg(fig, out, cfg_.plot);
    log_.info("Comparison written to " + out.string());
    return out;
}

void Session::set_attempt(const fs::path& path) {
    if (!fs::exists(path)) throw std::runtime_error("Attempt file not found: " + path.string());
    attempt_ = path;
}
