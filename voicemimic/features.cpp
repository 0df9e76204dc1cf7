#include "features.hpp"

#include "errors.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void check_frame_size(size_t frameSize) {
    if (frameSize == 0) throw std::invalid_argument("frame size must be positive");
}

size_t frame_count(size_t n, size_t frameSize) {
    return (n + frameSize - 1) / frameSize;
}

} // namespace

std::vector<float> compute_envelope(const std::vector<float>& samples, size_t frameSize) {
    check_frame_size(frameSize);
    std::vector<float> out;
    out.reserve(frame_count(samples.size(), frameSize));

    for (size_t start = 0; start < samples.size(); start += frameSize) {
        const size_t end = std::min(start + frameSize, samples.size());
        float peak = 0.0f;
        for (size_t i = start; i < end; i++) peak = std::max(peak, std::fabs(samples[i]));
        out.push_back(peak);
    }
    return out;
}

std::vector<float> compute_energy(const std::vector<float>& samples, size_t frameSize) {
    check_frame_size(frameSize);
    std::vector<float> out;
    out.reserve(frame_count(samples.size(), frameSize));

    for (size_t start = 0; start < samples.size(); start += frameSize) {
        const size_t end = std::min(start + frameSize, samples.size());
        // accumulate in double; 2048 squared samples lose precision in float
        double sum = 0.0;
        for (size_t i = start; i < end; i++) sum += static_cast<double>(samples[i]) * samples[i];
        out.push_back(static_cast<float>(sum));
    }
    return out;
}

std::vector<float> normalize(const std::vector<float>& samples) {
    if (samples.empty()) throw DegenerateSignalError("cannot normalize an empty signal");

    const float peak = peak_amplitude(samples);
    if (peak == 0.0f) throw DegenerateSignalError("cannot normalize an all-zero signal");

    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); i++) out[i] = samples[i] / peak;
    return out;
}

std::vector<float> trim_silence(const std::vector<float>& samples, double topDb,
                                size_t frameLength, size_t hopLength) {
    check_frame_size(frameLength);
    check_frame_size(hopLength);
    if (samples.empty()) return {};

    // Centred frames: frame t covers [t*hop - frameLength/2, t*hop + frameLength/2),
    // zero outside the signal.
    const size_t n = samples.size();
    const size_t frames = 1 + n / hopLength;
    const long half = static_cast<long>(frameLength / 2);

    std::vector<double> power(frames, 0.0);
    double maxPower = 0.0;
    for (size_t t = 0; t < frames; t++) {
        const long centre = static_cast<long>(t * hopLength);
        const long lo = std::max(0L, centre - half);
        const long hi = std::min(static_cast<long>(n), centre - half + static_cast<long>(frameLength));
        double sum = 0.0;
        for (long i = lo; i < hi; i++) sum += static_cast<double>(samples[i]) * samples[i];
        power[t] = sum / static_cast<double>(frameLength); // mean square = rms^2
        maxPower = std::max(maxPower, power[t]);
    }

    // every frame sits at 0 dB relative to a silent peak: nothing to trim
    if (maxPower <= 0.0) return samples;

    // 10*log10(p / pmax) > -topDb, with a floor for zero frames
    const double amin = 1e-10;
    auto loud = [&](double p) {
        return 10.0 * std::log10(std::max(amin, p) / maxPower) > -topDb;
    };

    size_t first = 0;
    while (first < frames && !loud(power[first])) first++;
    size_t last = frames;
    while (last > first && !loud(power[last - 1])) last--;

    const size_t start = std::min(n, first * hopLength);
    const size_t end = std::min(n, last * hopLength);
    if (end <= start) return {};
    return std::vector<float>(samples.begin() + static_cast<std::ptrdiff_t>(start),
                              samples.begin() + static_cast<std::ptrdiff_t>(end));
}

std::vector<float> match_length(const std::vector<float>& source, const std::vector<float>& target) {
    std::vector<float> out(source.begin(),
                           source.begin() + static_cast<std::ptrdiff_t>(std::min(source.size(), target.size())));
    out.resize(target.size(), 0.0f);
    return out;
}

FeatureBundle extract_features(const SampleBuffer& audio, size_t frameSize) {
    FeatureBundle f;
    f.sampleRate = audio.sampleRate;
    f.frameSize = frameSize;
    f.waveform = audio.samples;
    f.envelope = compute_envelope(audio.samples, frameSize);
    f.energy = compute_energy(audio.samples, frameSize);
    return f;
}

SampleBuffer load_audio(const fs::path& path, int expectedRate, Logger& log) {
    SampleBuffer out;
    try {
        out = to_mono(load_wav_to_float(path));
    } catch (const std::exception& e) {
        log.error(std::string("Error loading audio file: ") + e.what());
        throw;
    }
    if (out.sampleRate != expectedRate) {
        log.warn("Sample rate mismatch: " + path.filename().string() + " is " +
                 std::to_string(out.sampleRate) + "Hz, expected " + std::to_string(expectedRate) + "Hz");
    }
    return out;
}
