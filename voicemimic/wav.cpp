#include "wav.hpp"

#include "errors.hpp"
#include "utility.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>


AudioBuffer decode_wav(const std::vector<uint8_t>& b) {
    if (b.size() < 12) throw WavError("File too small."); //wav header is 12 bytes
    if (std::memcmp(b.data(), "RIFF", 4) != 0 || std::memcmp(b.data() + 8, "WAVE", 4) != 0) {
        throw WavError("Not a RIFF/WAVE file.");
    }

    // Walk chunks
    size_t off = 12;
    bool foundFmt = false, foundData = false;
    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    uint32_t dataSize = 0;
    size_t dataOff = 0;

    while (off + 8 <= b.size()) {
        const uint8_t* chunk = b.data() + off;
        uint32_t chunkSize = read_u32_le(chunk + 4);
        off += 8;

        if (off + chunkSize > b.size()) throw WavError("Malformed WAV chunk size.");

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunkSize < 16) throw WavError("Malformed fmt chunk.");
            audioFormat   = read_u16_le(b.data() + off + 0);
            numChannels   = read_u16_le(b.data() + off + 2);
            sampleRate    = read_u32_le(b.data() + off + 4);
            bitsPerSample = read_u16_le(b.data() + off + 14);

            // WAVE_FORMAT_EXTENSIBLE carries the real tag in the subformat GUID
            if (audioFormat == 0xFFFE && chunkSize >= 26) {
                audioFormat = read_u16_le(b.data() + off + 24);
            }
            if (numChannels < 1 || numChannels > 2) {
                throw WavError("Only mono/stereo WAV files are supported.");
            }
            if (sampleRate == 0) throw WavError("WAV sample rate is zero.");
            foundFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            dataSize = chunkSize;
            dataOff = off;
            foundData = true;
        }

        off += chunkSize;
        if (chunkSize % 2 == 1 && off < b.size()) off += 1; // word align
        if (foundFmt && foundData) break;
    }

    if (!foundFmt || !foundData) throw WavError("Missing fmt or data chunk.");

    // Convert to float buffer
    AudioBuffer out;
    out.sampleRate = static_cast<int>(sampleRate);
    out.channels = static_cast<int>(numChannels);

    const uint8_t* p = b.data() + dataOff;

    if (audioFormat == 1 && bitsPerSample == 16) {
        if (dataSize % 2 != 0) throw WavError("PCM16 data size not aligned.");
        size_t samples = dataSize / 2;
        out.data.resize(samples);
        for (size_t i = 0; i < samples; i++) {
            int16_t s = static_cast<int16_t>(read_u16_le(p + 2*i));
            out.data[i] = static_cast<float>(s) / 32768.0f;
        }
    } else if (audioFormat == 1 && bitsPerSample == 24) {
        if (dataSize % 3 != 0) throw WavError("PCM24 data size not aligned.");
        size_t samples = dataSize / 3;
        out.data.resize(samples);
        for (size_t i = 0; i < samples; i++) {
            const uint8_t* s = p + 3*i;
            // sign-extend from the top byte
            int32_t v = static_cast<int32_t>(static_cast<uint32_t>(s[0]) << 8 |
                                             static_cast<uint32_t>(s[1]) << 16 |
                                             static_cast<uint32_t>(s[2]) << 24) >> 8;
            out.data[i] = static_cast<float>(v) / 8388608.0f;
        }
    } else if (audioFormat == 1 && bitsPerSample == 32) {
        if (dataSize % 4 != 0) throw WavError("PCM32 data size not aligned.");
        size_t samples = dataSize / 4;
        out.data.resize(samples);
        for (size_t i = 0; i < samples; i++) {
            int32_t s = static_cast<int32_t>(read_u32_le(p + 4*i));
            out.data[i] = static_cast<float>(static_cast<double>(s) / 2147483648.0);
        }
    } else if (audioFormat == 3 && bitsPerSample == 32) {
        // IEEE float32
        if (dataSize % 4 != 0) throw WavError("Float32 data size not aligned.");
        size_t samples = dataSize / 4;
        out.data.resize(samples);
        for (size_t i = 0; i < samples; i++) {
            float f;
            std::memcpy(&f, p + 4*i, 4);
            out.data[i] = clampf(f, -1.0f, 1.0f);
        }
    } else {
        throw WavError("Unsupported WAV format (tag " + std::to_string(audioFormat) + ", " +
                       std::to_string(bitsPerSample) + " bit). Use PCM16/24/32 or Float32.");
    }

    // Sanity: must have whole frames
    if (out.data.size() % static_cast<size_t>(out.channels) != 0) {
        throw WavError("Data not aligned to channel count.");
    }

    return out;
}

AudioBuffer load_wav_to_float(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw WavError("Failed to open: " + path.string());

    std::vector<uint8_t> bytes;
    in.seekg(0, std::ios::end);
    auto sz = in.tellg();
    if (sz < 0) throw WavError("Failed to size file: " + path.string());
    in.seekg(0, std::ios::beg);
    bytes.resize(static_cast<size_t>(sz));
    if (!bytes.empty()) in.read(reinterpret_cast<char*>(bytes.data()), sz);
    if (!in) throw WavError("Failed to read file: " + path.string());

    try {
        return decode_wav(bytes);
    } catch (const WavError& e) {
        throw WavError(path.string() + ": " + e.what());
    }
}

std::vector<uint8_t> encode_wav_float(const SampleBuffer& audio) {
    if (audio.sampleRate <= 0) throw WavError("Cannot write WAV with non-positive sample rate.");

    const uint16_t channels = 1;
    const uint16_t bits = 32;
    const uint32_t dataSize = static_cast<uint32_t>(audio.samples.size() * sizeof(float));
    const uint32_t byteRate = static_cast<uint32_t>(audio.sampleRate) * channels * (bits / 8);

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);

    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    write_u32_le(out, 36 + dataSize);
    out.insert(out.end(), {'W', 'A', 'V', 'E'});

    out.insert(out.end(), {'f', 'm', 't', ' '});
    write_u32_le(out, 16);
    write_u16_le(out, 3); // IEEE float
    write_u16_le(out, channels);
    write_u32_le(out, static_cast<uint32_t>(audio.sampleRate));
    write_u32_le(out, byteRate);
    write_u16_le(out, static_cast<uint16_t>(channels * (bits / 8)));
    write_u16_le(out, bits);

    out.insert(out.end(), {'d', 'a', 't', 'a'});
    write_u32_le(out, dataSize);
    const size_t start = out.size();
    out.resize(start + dataSize);
    if (dataSize > 0) std::memcpy(out.data() + start, audio.samples.data(), dataSize);

    return out;
}

void save_wav_float(const fs::path& path, const SampleBuffer& audio) {
    std::vector<uint8_t> bytes = encode_wav_float(audio);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw WavError("Failed to open for writing: " + path.string());
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw WavError("Failed to write file: " + path.string());
}
