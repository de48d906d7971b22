#pragma once

#include "error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sobotta {

struct WavData {
    std::vector<float> samples;  // Interleaved
    int sample_rate = 0;
    int channels = 0;
};

// Mono 32-bit float WAV, in memory
Error encode_wav(const std::vector<float>& samples, int sample_rate, std::vector<uint8_t>& out);

// Mono 32-bit float WAV on disk (parent directories are created)
Error save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate);

// Any PCM or float WAV. Integer samples are scaled by 1 / 2^(bits-1).
Error read_wav(const std::string& path, WavData& out);

} // namespace sobotta
