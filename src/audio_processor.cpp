#include "audio_processor.hpp"
#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace sobotta {

std::vector<float> AudioProcessor::to_mono(const std::vector<float>& samples, int channels) {
    if (channels <= 1) return samples;

    const size_t ch = static_cast<size_t>(channels);
    const size_t frames = samples.size() / ch;

    std::vector<float> mono;
    mono.reserve(frames);

    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (size_t c = 0; c < ch; ++c) {
            sum += samples[f * ch + c];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }

    return mono;
}

std::vector<float> AudioProcessor::resample(const std::vector<float>& samples,
                                            int source_rate, int target_rate) {
    if (source_rate == target_rate || source_rate <= 0 || target_rate <= 0) {
        return samples;
    }

    const double ratio = static_cast<double>(source_rate) / static_cast<double>(target_rate);
    const size_t output_len = static_cast<size_t>(static_cast<double>(samples.size()) / ratio);

    std::vector<float> output;
    output.reserve(output_len);

    for (size_t i = 0; i < output_len; ++i) {
        double src_pos = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - static_cast<double>(idx);

        double sample = 0.0;
        if (idx + 1 < samples.size()) {
            sample = samples[idx] * (1.0 - frac) + samples[idx + 1] * frac;
        } else if (idx < samples.size()) {
            // Last input sample has no right neighbour; hold it
            sample = samples[idx];
        }
        output.push_back(static_cast<float>(sample));
    }

    return output;
}

std::vector<float> AudioProcessor::normalize(std::vector<float> samples) {
    if (samples.empty()) return samples;

    // Find peak
    float peak = 0.0f;
    for (float sample : samples) {
        peak = std::max(peak, std::abs(sample));
    }

    // Don't amplify the noise floor
    if (peak < SILENCE_PEAK) return samples;

    float gain = std::min(TARGET_PEAK / peak, MAX_GAIN);

    for (float& sample : samples) {
        sample *= gain;
    }

    return samples;
}

float AudioProcessor::rms_energy(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    double sum_sq = 0.0;
    for (float sample : samples) {
        sum_sq += static_cast<double>(sample) * sample;
    }
    return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(samples.size())));
}

std::vector<float> AudioProcessor::preprocess(const std::vector<float>& samples,
                                              int channels, int sample_rate) {
    // Order matters: mono before resample before normalize
    auto mono = to_mono(samples, channels);
    auto resampled = resample(mono, sample_rate, TARGET_SAMPLE_RATE);
    return normalize(std::move(resampled));
}

} // namespace sobotta
