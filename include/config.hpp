#pragma once

#include "error.hpp"

#include <string>

namespace sobotta {

// All captured and imported audio is converted to this rate before STT
constexpr int TARGET_SAMPLE_RATE = 16000;

struct Config {
    // Storage (models/, audio/, vocabulary.txt, config.json live here)
    std::string data_dir;           // Empty = ~/.sobotta

    // Audio capture
    int frames_per_buffer = 512;    // Low latency buffer
    int max_channels = 2;           // Cap on channels requested from the device
    bool save_audio = true;         // Keep a WAV of every recording under audio/

    // Level meter
    int level_interval_ms = 50;
    int level_window_samples = 2048;

    // Speech-to-text
    std::string model_id = "whisper-base";
    std::string language = "auto";  // ISO code or "auto"
    int n_threads = 4;              // CPU threads for local inference (capped at 8)
    bool use_gpu = true;
    float silence_rms_threshold = 0.01f;  // Below this the audio is treated as silence
    bool release_session_after_transcribe = true;

    // Remote engines
    std::string openai_api_key;
    std::string openai_model = "whisper-1";
    std::string groq_api_key;
    std::string groq_model = "whisper-large-v3-turbo";
    int remote_timeout_ms = 30000;

    // Hotkey
    std::string hotkey = "Alt+Space";
    std::string recording_mode = "push-to-talk";  // or "toggle"

    // Vocabulary (empty = <data_dir>/vocabulary.txt)
    std::string vocabulary_path;

    std::string resolved_data_dir() const;
    std::string models_dir() const { return resolved_data_dir() + "/models"; }
    std::string audio_dir() const { return resolved_data_dir() + "/audio"; }
    std::string resolved_vocabulary_path() const;
    std::string default_config_path() const { return resolved_data_dir() + "/config.json"; }
};

// Overlay values from a JSON settings file. A missing file is not an error;
// keys of the wrong type are reported and skipped.
Error load_config_file(const std::string& path, Config& config);

// Fill empty API keys from OPENAI_API_KEY / GROQ_API_KEY
void apply_environment(Config& config);

} // namespace sobotta
