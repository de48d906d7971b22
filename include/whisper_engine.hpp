#pragma once

#include "transcriber.hpp"

#include <mutex>
#include <string>

// Forward declare whisper types
struct whisper_context;

namespace sobotta {

// Local encoder-decoder engine backed by whisper.cpp
class WhisperEngine : public SttEngine {
public:
    WhisperEngine(int n_threads = 4, bool use_gpu = true);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    // Load a ggml model file
    Error initialize(const std::string& model_path);
    bool is_initialized() const { return ctx_ != nullptr; }

    TranscriptionResult transcribe(const std::vector<float>& audio,
                                   const TranscriptionOptions& options) override;

    const char* name() const override { return "whisper"; }

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_;
    bool use_gpu_;
    std::mutex ctx_mutex_;  // whisper_full on one context is not reentrant
};

} // namespace sobotta
