#pragma once

#include "transcriber.hpp"

#include <mutex>
#include <string>
#include <vector>

struct SherpaOnnxOfflineRecognizer;

namespace sobotta {

// Local transducer engine: NeMo Parakeet TDT through the sherpa-onnx C API
class ParakeetEngine : public SttEngine {
public:
    ParakeetEngine(int n_threads = 4);
    ~ParakeetEngine() override;

    ParakeetEngine(const ParakeetEngine&) = delete;
    ParakeetEngine& operator=(const ParakeetEngine&) = delete;

    // files: encoder, decoder, joiner, tokens (relative to model_dir)
    Error initialize(const std::string& model_dir, const std::vector<std::string>& files);

    TranscriptionResult transcribe(const std::vector<float>& audio,
                                   const TranscriptionOptions& options) override;

    const char* name() const override { return "parakeet"; }

private:
    const SherpaOnnxOfflineRecognizer* recognizer_ = nullptr;
    int n_threads_;
    std::mutex mutex_;
};

} // namespace sobotta
