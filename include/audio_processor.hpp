#pragma once

#include <vector>

namespace sobotta {

// Stateless preprocessing chain applied to all captured and imported audio:
// mono-mix -> resample to 16kHz -> peak normalization.
class AudioProcessor {
public:
    static constexpr float TARGET_PEAK = 0.95f;
    static constexpr float SILENCE_PEAK = 0.001f;  // -60dB, never amplified
    static constexpr float MAX_GAIN = 30.0f;

    // Average each interleaved frame. A trailing partial frame is dropped.
    static std::vector<float> to_mono(const std::vector<float>& samples, int channels);

    // Linear interpolation resampler
    static std::vector<float> resample(const std::vector<float>& samples,
                                       int source_rate, int target_rate);

    // Scale to TARGET_PEAK, gain capped at MAX_GAIN
    static std::vector<float> normalize(std::vector<float> samples);

    // sqrt(mean(x^2)), 0 for empty input
    static float rms_energy(const std::vector<float>& samples);

    // normalize(resample(to_mono(samples, channels), sample_rate, 16000))
    static std::vector<float> preprocess(const std::vector<float>& samples,
                                         int channels, int sample_rate);
};

} // namespace sobotta
