#include "whisper_engine.hpp"
#include "config.hpp"
#include "vocabulary.hpp"
#include "whisper.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace sobotta {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    if (start == std::string::npos || end == std::string::npos) return "";
    return text.substr(start, end - start + 1);
}

} // namespace

WhisperEngine::WhisperEngine(int n_threads, bool use_gpu)
    : n_threads_(std::clamp(n_threads, 1, 8))
    , use_gpu_(use_gpu) {
}

WhisperEngine::~WhisperEngine() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

Error WhisperEngine::initialize(const std::string& model_path) {
    if (ctx_) return {};

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;

    auto start = std::chrono::steady_clock::now();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        return Error::make(ErrorCode::EngineLoadFailed,
                           "Failed to load whisper model: " + model_path);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "[stt] Loaded whisper model " << model_path << " in "
              << elapsed.count() << "ms" << std::endl;
    return {};
}

TranscriptionResult WhisperEngine::transcribe(const std::vector<float>& audio,
                                              const TranscriptionOptions& options) {
    if (!ctx_) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::InferenceFailed, "whisper: engine not initialized"));
    }
    if (audio.empty()) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::EmptyAudio, "whisper: no audio data"));
    }

    std::lock_guard<std::mutex> lock(ctx_mutex_);

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_timestamps    = false;
    wparams.single_segment   = false;
    wparams.n_threads        = n_threads_;
    wparams.greedy.best_of   = 1;

    // "auto" makes whisper detect the language before decoding
    const std::string language = options.auto_language() ? "auto" : *options.language;
    wparams.language = language.c_str();

    // Vocabulary biases decoding through the initial prompt
    const std::string prompt = build_prompt(options.vocabulary);
    wparams.no_context = prompt.empty();
    if (!prompt.empty()) {
        wparams.initial_prompt = prompt.c_str();
    }

    auto start_time = std::chrono::steady_clock::now();

    int ret = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        return TranscriptionResult::failure(Error::make(
            ErrorCode::InferenceFailed, "whisper: inference failed (code " + std::to_string(ret) + ")"));
    }

    auto end_time = std::chrono::steady_clock::now();

    TranscriptionResult result;
    std::string text;

    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (!segment_text) continue;

        // Timestamps are in centiseconds
        Segment segment;
        segment.start_ms = whisper_full_get_segment_t0(ctx_, i) * 10;
        segment.end_ms = whisper_full_get_segment_t1(ctx_, i) * 10;
        segment.text = segment_text;

        text += segment_text;
        result.segments.push_back(std::move(segment));
    }

    result.text = trim(text);
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();

    if (!options.auto_language()) {
        result.language = *options.language;
    } else {
        const int lang_id = whisper_full_lang_id(ctx_);
        if (lang_id >= 0) {
            if (const char* detected = whisper_lang_str(lang_id)) {
                result.language = detected;
            }
        }
    }

    std::cout << "[stt] whisper: " << result.segments.size() << " segments, "
              << result.duration_ms << "ms inference, lang="
              << result.language.value_or("?") << std::endl;

    return result;
}

} // namespace sobotta
