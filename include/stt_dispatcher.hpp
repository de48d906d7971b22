#pragma once

#include "config.hpp"
#include "engine_cache.hpp"
#include "model_catalog.hpp"
#include "session_store.hpp"
#include "transcriber.hpp"
#include "vocabulary.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace sobotta {

// Builds the engine for a remote catalog entry (not cached)
using RemoteEngineFactory = std::function<std::shared_ptr<SttEngine>(
    const ModelInfo& model, Error& error)>;

RemoteEngineFactory remote_engine_factory(const Config& config);

struct DispatcherOptions {
    float silence_rms_threshold = 0.01f;
    bool release_session_after_transcribe = true;
};

// Resolves a session's audio and a model's engine, then runs inference on a
// worker thread. Local inference is serialized process-wide.
class SttDispatcher {
public:
    SttDispatcher(SessionStore& sessions,
                  const ModelCatalog& catalog,
                  EngineCache& engines,
                  RemoteEngineFactory remote_factory,
                  const VocabularyStore* vocabulary = nullptr,
                  DispatcherOptions options = {});

    // Never blocks on inference. Lookup failures and silence come back as
    // already-ready futures.
    std::future<TranscriptionResult> transcribe_async(const std::string& session_id,
                                                      const std::string& model_id,
                                                      TranscriptionOptions options);

    TranscriptionResult transcribe(const std::string& session_id,
                                   const std::string& model_id,
                                   TranscriptionOptions options);

    // Held for the duration of every local inference call, whatever the model
    static std::mutex& inference_mutex();

private:
    TranscriptionResult run(const std::string& session_id, const ModelInfo& model,
                            SessionAudio audio, const TranscriptionOptions& options);

    SessionStore& sessions_;
    const ModelCatalog& catalog_;
    EngineCache& engines_;
    RemoteEngineFactory remote_factory_;
    const VocabularyStore* vocabulary_;
    DispatcherOptions options_;
};

} // namespace sobotta
