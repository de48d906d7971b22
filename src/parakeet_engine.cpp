#include "parakeet_engine.hpp"
#include "config.hpp"

#include "sherpa-onnx/c-api/c-api.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <utility>

namespace sobotta {

ParakeetEngine::ParakeetEngine(int n_threads)
    : n_threads_(std::clamp(n_threads, 1, 8)) {
}

ParakeetEngine::~ParakeetEngine() {
    if (recognizer_) {
        SherpaOnnxDestroyOfflineRecognizer(recognizer_);
        recognizer_ = nullptr;
    }
}

Error ParakeetEngine::initialize(const std::string& model_dir, const std::vector<std::string>& files) {
    if (recognizer_) return {};

    if (files.size() < 4) {
        return Error::make(ErrorCode::EngineLoadFailed,
                           "parakeet: expected encoder, decoder, joiner and tokens files");
    }

    namespace fs = std::filesystem;
    const std::string encoder = (fs::path(model_dir) / files[0]).string();
    const std::string decoder = (fs::path(model_dir) / files[1]).string();
    const std::string joiner = (fs::path(model_dir) / files[2]).string();
    const std::string tokens = (fs::path(model_dir) / files[3]).string();

    SherpaOnnxOfflineRecognizerConfig config;
    std::memset(&config, 0, sizeof(config));

    config.feat_config.sample_rate = TARGET_SAMPLE_RATE;
    config.feat_config.feature_dim = 80;

    config.model_config.transducer.encoder = encoder.c_str();
    config.model_config.transducer.decoder = decoder.c_str();
    config.model_config.transducer.joiner = joiner.c_str();
    config.model_config.tokens = tokens.c_str();
    config.model_config.num_threads = n_threads_;
    config.model_config.provider = "cpu";
    config.model_config.model_type = "nemo_transducer";
    config.model_config.debug = 0;

    config.decoding_method = "greedy_search";

    std::cout << "[stt] Loading parakeet model from " << model_dir
              << " (threads=" << n_threads_ << ")" << std::endl;

    auto start = std::chrono::steady_clock::now();
    recognizer_ = SherpaOnnxCreateOfflineRecognizer(&config);
    if (!recognizer_) {
        return Error::make(ErrorCode::EngineLoadFailed,
                           "parakeet: failed to create recognizer from " + model_dir);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "[stt] Parakeet engine loaded in " << elapsed.count() << "ms" << std::endl;
    return {};
}

TranscriptionResult ParakeetEngine::transcribe(const std::vector<float>& audio,
                                               const TranscriptionOptions& options) {
    (void)options;  // Transducer decoding takes no language or prompt hints

    if (!recognizer_) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::InferenceFailed, "parakeet: engine not initialized"));
    }
    if (audio.empty()) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::EmptyAudio, "parakeet: no audio data"));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto start = std::chrono::steady_clock::now();

    const SherpaOnnxOfflineStream* stream = SherpaOnnxCreateOfflineStream(recognizer_);
    if (!stream) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::InferenceFailed, "parakeet: failed to create stream"));
    }

    SherpaOnnxAcceptWaveformOffline(stream, TARGET_SAMPLE_RATE, audio.data(),
                                    static_cast<int32_t>(audio.size()));
    SherpaOnnxDecodeOfflineStream(recognizer_, stream);

    const SherpaOnnxOfflineRecognizerResult* r = SherpaOnnxGetOfflineStreamResult(stream);
    if (!r) {
        SherpaOnnxDestroyOfflineStream(stream);
        return TranscriptionResult::failure(
            Error::make(ErrorCode::InferenceFailed, "parakeet: no result from decoder"));
    }

    std::string text = r->text ? r->text : "";
    SherpaOnnxDestroyOfflineRecognizerResult(r);
    SherpaOnnxDestroyOfflineStream(stream);

    size_t first = text.find_first_not_of(" \t\n\r");
    size_t last = text.find_last_not_of(" \t\n\r");
    text = (first == std::string::npos) ? "" : text.substr(first, last - first + 1);

    TranscriptionResult result;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    // One segment spanning the whole utterance
    if (!text.empty()) {
        Segment segment;
        segment.start_ms = 0;
        segment.end_ms = static_cast<int64_t>(audio.size()) * 1000 / TARGET_SAMPLE_RATE;
        segment.text = text;
        result.segments.push_back(segment);
    }
    result.text = std::move(text);

    std::cout << "[stt] parakeet: " << result.duration_ms << "ms inference, "
              << audio.size() << " samples" << std::endl;
    return result;
}

} // namespace sobotta
