#pragma once

#include "buffer.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// Accepts PCM16, PCM24, PCM32 and IEEE float32, mono or stereo.
AudioBuffer decode_wav(const std::vector<uint8_t>& b);
AudioBuffer load_wav_to_float(const fs::path& path);

// Always writes mono IEEE float32 (format tag 3).
std::vector<uint8_t> encode_wav_float(const SampleBuffer& audio);
void save_wav_float(const fs::path& path, const SampleBuffer& audio);
