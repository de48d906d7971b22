// Automated tests for AudioProcessor

#include "audio_processor.hpp"
#include <iostream>
#include <cmath>
#include <cassert>

using namespace sobotta;

// Generate test signals
std::vector<float> generate_sine(int samples, float freq, float amplitude, int sample_rate = 16000) {
    std::vector<float> audio(samples);
    for (int i = 0; i < samples; ++i) {
        audio[i] = amplitude * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / sample_rate);
    }
    return audio;
}

float calculate_peak(const std::vector<float>& audio) {
    float peak = 0.0f;
    for (float s : audio) {
        float abs_s = std::abs(s);
        if (abs_s > peak) peak = abs_s;
    }
    return peak;
}

bool near(float a, float b, float tol = 1e-5f) {
    return std::abs(a - b) <= tol;
}

void test_to_mono() {
    std::cout << "Testing mono mixing..." << std::endl;

    std::vector<float> mono_in = {0.1f, -0.2f, 0.3f};
    assert(AudioProcessor::to_mono(mono_in, 1) == mono_in && "Single channel is identity");

    for (int channels = 2; channels <= 6; ++channels) {
        std::vector<float> input;
        for (int frame = 0; frame < 10; ++frame) {
            for (int c = 0; c < channels; ++c) {
                input.push_back(0.01f * static_cast<float>(frame * channels + c));
            }
        }
        auto mono = AudioProcessor::to_mono(input, channels);
        assert(mono.size() == input.size() / channels && "One output per frame");

        for (size_t f = 0; f < mono.size(); ++f) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) sum += input[f * channels + c];
            assert(near(mono[f], sum / channels) && "Output is the frame average");
        }
    }

    // Trailing partial frame is dropped
    std::vector<float> ragged = {0.2f, 0.4f, 0.6f, 0.8f, 0.9f};
    auto mono = AudioProcessor::to_mono(ragged, 2);
    assert(mono.size() == 2);
    assert(near(mono[0], 0.3f) && near(mono[1], 0.7f));

    std::cout << "  PASS: Mono mixing averages frames" << std::endl;
}

void test_resample() {
    std::cout << "Testing resampling..." << std::endl;

    auto sine = generate_sine(4800, 440.0f, 0.5f, 48000);
    assert(AudioProcessor::resample(sine, 48000, 48000) == sine && "Equal rates are identity");
    assert(AudioProcessor::resample(sine, 16000, 16000) == sine);

    auto down = AudioProcessor::resample(sine, 48000, 16000);
    assert(down.size() == 1600 && "Length is input / ratio");

    auto up = AudioProcessor::resample(std::vector<float>(100, 0.0f), 8000, 16000);
    assert(up.size() == 200);

    // Constant in, same constant out, for any ratio
    const int rates[][2] = {{48000, 16000}, {44100, 16000}, {22050, 16000}, {8000, 16000}, {11025, 16000}};
    for (const auto& r : rates) {
        std::vector<float> constant(1000, 0.42f);
        auto out = AudioProcessor::resample(constant, r[0], r[1]);
        assert(!out.empty());
        for (float s : out) {
            assert(near(s, 0.42f) && "Constant signal stays constant");
        }
    }

    assert(AudioProcessor::resample({}, 48000, 16000).empty());

    std::cout << "  PASS: Linear resampling" << std::endl;
}

void test_normalization() {
    std::cout << "Testing normalization..." << std::endl;

    // Achievable gain: peak lands exactly on 0.95
    auto quiet = generate_sine(1600, 300.0f, 0.1f);
    float peak = calculate_peak(AudioProcessor::normalize(quiet));
    assert(near(peak, 0.95f, 1e-4f) && "Peak scaled to 0.95");

    // Gain capped at 30x: 0.01 -> 0.30, not 0.95
    std::vector<float> faint = {0.01f, -0.005f, 0.0f, -0.01f};
    auto faint_out = AudioProcessor::normalize(faint);
    assert(near(calculate_peak(faint_out), 0.30f, 1e-5f) && "Gain capped at 30x");

    // Below 0.001 is silence, returned untouched
    std::vector<float> noise_floor = {0.0005f, -0.0009f, 0.0002f};
    assert(AudioProcessor::normalize(noise_floor) == noise_floor && "Noise floor never amplified");

    // Loud input is brought down
    std::vector<float> loud = {1.5f, -2.0f, 0.5f};
    assert(near(calculate_peak(AudioProcessor::normalize(loud)), 0.95f, 1e-5f));

    assert(AudioProcessor::normalize({}).empty());

    std::cout << "  PASS: Peak normalization" << std::endl;
}

void test_rms() {
    std::cout << "Testing RMS energy..." << std::endl;

    assert(AudioProcessor::rms_energy({}) == 0.0f && "Empty input is 0");
    assert(near(AudioProcessor::rms_energy(std::vector<float>(100, 0.5f)), 0.5f));
    assert(near(AudioProcessor::rms_energy({0.3f, -0.4f}), std::sqrt(0.125f)));

    auto sine = generate_sine(16000, 100.0f, 1.0f);
    assert(near(AudioProcessor::rms_energy(sine), 1.0f / std::sqrt(2.0f), 1e-3f));

    std::cout << "  PASS: RMS energy" << std::endl;
}

void test_full_chain() {
    std::cout << "Testing full processing chain..." << std::endl;

    // Stereo [0.2,0.8,0.4,0.6] at 16kHz -> [0.5,0.5] -> [0.95,0.95]
    auto out = AudioProcessor::preprocess({0.2f, 0.8f, 0.4f, 0.6f}, 2, 16000);
    assert(out.size() == 2);
    assert(near(out[0], 0.95f) && near(out[1], 0.95f) && "mono -> resample -> normalize");

    // 48kHz stereo second of audio becomes 16000 mono samples
    std::vector<float> stereo;
    auto left = generate_sine(48000, 440.0f, 0.2f, 48000);
    for (float s : left) {
        stereo.push_back(s);
        stereo.push_back(s);
    }
    auto processed = AudioProcessor::preprocess(stereo, 2, 48000);
    assert(processed.size() == 16000);
    assert(calculate_peak(processed) <= 0.95f + 1e-4f && "Audio should not clip");

    std::cout << "  PASS: Full processing chain working" << std::endl;
}

int main() {
    std::cout << "\n=== Audio Processor Test Suite ===" << std::endl << std::endl;

    test_to_mono();
    test_resample();
    test_normalization();
    test_rms();
    test_full_chain();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
