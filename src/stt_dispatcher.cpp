#include "stt_dispatcher.hpp"
#include "audio_processor.hpp"
#include "remote_engine.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

namespace sobotta {

namespace {

std::future<TranscriptionResult> ready_future(TranscriptionResult result) {
    std::promise<TranscriptionResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

RemoteEngineFactory remote_engine_factory(const Config& config) {
    return [config](const ModelInfo& model, Error& error) -> std::shared_ptr<SttEngine> {
        switch (model.engine) {
            case EngineKind::CloudOpenAI:
                return std::make_shared<RemoteEngine>(openai_endpoint(
                    config.openai_api_key, config.openai_model, config.remote_timeout_ms));
            case EngineKind::CloudGroq:
                return std::make_shared<RemoteEngine>(groq_endpoint(
                    config.groq_api_key, config.groq_model, config.remote_timeout_ms));
            case EngineKind::Whisper:
            case EngineKind::Parakeet:
                break;
        }
        error = Error::make(ErrorCode::EngineLoadFailed, model.id + " is not a remote model");
        return nullptr;
    };
}

SttDispatcher::SttDispatcher(SessionStore& sessions,
                             const ModelCatalog& catalog,
                             EngineCache& engines,
                             RemoteEngineFactory remote_factory,
                             const VocabularyStore* vocabulary,
                             DispatcherOptions options)
    : sessions_(sessions)
    , catalog_(catalog)
    , engines_(engines)
    , remote_factory_(std::move(remote_factory))
    , vocabulary_(vocabulary)
    , options_(options) {
}

std::mutex& SttDispatcher::inference_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::future<TranscriptionResult> SttDispatcher::transcribe_async(const std::string& session_id,
                                                                 const std::string& model_id,
                                                                 TranscriptionOptions options) {
    SessionAudio audio = sessions_.get(session_id);
    if (!audio) {
        return ready_future(TranscriptionResult::failure(
            Error::make(ErrorCode::SessionNotFound, "Session not found: " + session_id)));
    }

    if (audio->empty()) {
        return ready_future(TranscriptionResult::failure(
            Error::make(ErrorCode::EmptyAudio, "No audio data in session " + session_id)));
    }

    // Near-silent input makes engines hallucinate ("Thank you."), skip it
    const float rms = AudioProcessor::rms_energy(*audio);
    std::cout << "[stt] Audio RMS energy: " << std::fixed << std::setprecision(6) << rms
              << std::defaultfloat << " (" << audio->size() << " samples)" << std::endl;
    if (rms < options_.silence_rms_threshold) {
        std::cout << "[stt] Audio is silence, skipping transcription" << std::endl;
        if (options_.release_session_after_transcribe) {
            sessions_.remove(session_id);
        }
        return ready_future(TranscriptionResult{});
    }

    auto model = catalog_.find(model_id);
    if (!model) {
        return ready_future(TranscriptionResult::failure(
            Error::make(ErrorCode::UnknownModel, "Unknown model: " + model_id)));
    }

    if (options.vocabulary.empty() && vocabulary_) {
        options.vocabulary = vocabulary_->list_terms();
    }

    return std::async(std::launch::async,
                      [this, session_id, m = *model, audio, opts = std::move(options)]() {
                          return run(session_id, m, audio, opts);
                      });
}

TranscriptionResult SttDispatcher::transcribe(const std::string& session_id,
                                              const std::string& model_id,
                                              TranscriptionOptions options) {
    return transcribe_async(session_id, model_id, std::move(options)).get();
}

TranscriptionResult SttDispatcher::run(const std::string& session_id, const ModelInfo& model,
                                       SessionAudio audio, const TranscriptionOptions& options) {
    std::cout << "[stt] Starting transcription: " << audio->size() << " samples, model="
              << model.id << std::endl;

    Error error;
    TranscriptionResult result;

    if (is_remote(model.engine)) {
        std::shared_ptr<SttEngine> engine = remote_factory_ ? remote_factory_(model, error) : nullptr;
        if (!engine) {
            if (error.ok()) {
                error = Error::make(ErrorCode::EngineLoadFailed, "No remote engine for " + model.id);
            }
            return TranscriptionResult::failure(error);
        }
        result = engine->transcribe(*audio, options);
    } else {
        std::shared_ptr<SttEngine> engine = engines_.get_or_load(model.id, error);
        if (!engine) {
            return TranscriptionResult::failure(error);
        }

        std::lock_guard<std::mutex> lock(inference_mutex());
        result = engine->transcribe(*audio, options);
    }

    if (!result.ok()) {
        // Not retried; report with the model that failed
        result.error.message = model.id + " (" + engine_kind_name(model.engine) + "): "
                             + result.error.message;
        std::cerr << "[stt] Transcription failed: " << result.error.describe() << std::endl;
        return result;
    }

    if (options_.release_session_after_transcribe) {
        sessions_.remove(session_id);
    }

    std::cout << "[stt] Transcription took " << result.duration_ms << "ms: \""
              << result.text << "\"" << std::endl;
    return result;
}

} // namespace sobotta
