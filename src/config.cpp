#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace sobotta {

namespace {

template <typename T>
void read_key(const nlohmann::json& cfg, const char* key, T& out) {
    auto it = cfg.find(key);
    if (it == cfg.end() || it->is_null()) return;

    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

std::string Config::resolved_data_dir() const {
    if (!data_dir.empty()) return data_dir;

    const char* home = std::getenv("HOME");
    if (!home) return ".sobotta";
    return std::string(home) + "/.sobotta";
}

std::string Config::resolved_vocabulary_path() const {
    if (!vocabulary_path.empty()) return vocabulary_path;
    return resolved_data_dir() + "/vocabulary.txt";
}

Error load_config_file(const std::string& path, Config& config) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Error::make(ErrorCode::IoError, "Cannot open config file: " + path);
    }

    nlohmann::json cfg;
    try {
        file >> cfg;
    } catch (const nlohmann::json::parse_error& e) {
        return Error::make(ErrorCode::InvalidArgument,
                           "Malformed config file " + path + ": " + e.what());
    }

    if (!cfg.is_object()) {
        return Error::make(ErrorCode::InvalidArgument, "Config root must be an object: " + path);
    }

    read_key(cfg, "data_dir", config.data_dir);
    read_key(cfg, "frames_per_buffer", config.frames_per_buffer);
    read_key(cfg, "max_channels", config.max_channels);
    read_key(cfg, "save_audio", config.save_audio);
    read_key(cfg, "level_interval_ms", config.level_interval_ms);
    read_key(cfg, "level_window_samples", config.level_window_samples);
    read_key(cfg, "model_id", config.model_id);
    read_key(cfg, "language", config.language);
    read_key(cfg, "n_threads", config.n_threads);
    read_key(cfg, "use_gpu", config.use_gpu);
    read_key(cfg, "silence_rms_threshold", config.silence_rms_threshold);
    read_key(cfg, "release_session_after_transcribe", config.release_session_after_transcribe);
    read_key(cfg, "remote_timeout_ms", config.remote_timeout_ms);
    read_key(cfg, "hotkey", config.hotkey);
    read_key(cfg, "recording_mode", config.recording_mode);
    read_key(cfg, "vocabulary_path", config.vocabulary_path);

    if (auto remote = cfg.find("remote"); remote != cfg.end() && remote->is_object()) {
        if (auto openai = remote->find("openai"); openai != remote->end() && openai->is_object()) {
            read_key(*openai, "api_key", config.openai_api_key);
            read_key(*openai, "model", config.openai_model);
        }
        if (auto groq = remote->find("groq"); groq != remote->end() && groq->is_object()) {
            read_key(*groq, "api_key", config.groq_api_key);
            read_key(*groq, "model", config.groq_model);
        }
    }

    std::cout << "[config] Loaded " << path << std::endl;
    return {};
}

void apply_environment(Config& config) {
    if (config.openai_api_key.empty()) {
        if (const char* key = std::getenv("OPENAI_API_KEY")) config.openai_api_key = key;
    }
    if (config.groq_api_key.empty()) {
        if (const char* key = std::getenv("GROQ_API_KEY")) config.groq_api_key = key;
    }
}

} // namespace sobotta
