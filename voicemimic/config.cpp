#include "config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>


void validate(const Config& cfg) {
    if (cfg.audio.sampleRate <= 0) throw std::invalid_argument("sample rate must be positive");
    if (cfg.audio.channels < 1 || cfg.audio.channels > 2) {
        throw std::invalid_argument("channels must be 1 or 2");
    }
    if (cfg.audio.chunkSize == 0) throw std::invalid_argument("chunk size must be positive");
    if (cfg.audio.joinTimeout.count() < 0) throw std::invalid_argument("join timeout must not be negative");
    if (cfg.analysis.frameSize == 0) throw std::invalid_argument("frame size must be positive");
    if (cfg.analysis.trimFrameLength == 0 || cfg.analysis.trimHopLength == 0) {
        throw std::invalid_argument("trim frame and hop length must be positive");
    }
    if (cfg.analysis.trimTopDb <= 0.0) throw std::invalid_argument("trim threshold must be positive dB");
    if (cfg.plot.dpi <= 0 || cfg.plot.width_px() <= 0 || cfg.plot.height_px() <= 0) {
        throw std::invalid_argument("plot size must be positive");
    }
}

void ensure_directories(const Config& cfg) {
    for (const fs::path& dir : {cfg.references_dir(), cfg.temp_dir(), cfg.recordings_dir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + dir.string() + ": " + ec.message());
        }
    }
}
