#include "engine_cache.hpp"
#include "parakeet_engine.hpp"
#include "whisper_engine.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace sobotta {

EngineFactory local_engine_factory(LocalEngineSettings settings) {
    return [settings](const ModelInfo& model, const std::string& model_dir,
                      Error& error) -> std::shared_ptr<SttEngine> {
        switch (model.engine) {
            case EngineKind::Whisper: {
                if (model.files.empty()) {
                    error = Error::make(ErrorCode::EngineLoadFailed,
                                        model.id + ": catalog entry lists no model file");
                    return nullptr;
                }
                auto engine = std::make_shared<WhisperEngine>(settings.n_threads, settings.use_gpu);
                std::string path = (std::filesystem::path(model_dir) / model.files[0]).string();
                error = engine->initialize(path);
                if (!error.ok()) return nullptr;
                return engine;
            }
            case EngineKind::Parakeet: {
                auto engine = std::make_shared<ParakeetEngine>(settings.n_threads);
                error = engine->initialize(model_dir, model.files);
                if (!error.ok()) return nullptr;
                return engine;
            }
            case EngineKind::CloudOpenAI:
            case EngineKind::CloudGroq:
                break;
        }
        error = Error::make(ErrorCode::EngineLoadFailed,
                            model.id + ": remote models are not loaded as local engines");
        return nullptr;
    };
}

EngineCache::EngineCache(const ModelCatalog& catalog, EngineFactory factory)
    : catalog_(catalog)
    , factory_(std::move(factory)) {
}

std::shared_ptr<SttEngine> EngineCache::get_or_load(const std::string& model_id, Error& error) {
    // Held across the load so concurrent first requests build a single instance
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = engines_.find(model_id);
    if (it != engines_.end()) {
        error = {};
        return it->second;
    }

    auto model = catalog_.find(model_id);
    if (!model) {
        error = Error::make(ErrorCode::UnknownModel, "Unknown model: " + model_id);
        return nullptr;
    }

    if (!catalog_.is_downloaded(*model)) {
        error = Error::make(ErrorCode::ModelNotDownloaded,
                            "Model '" + model_id + "' is not downloaded");
        return nullptr;
    }

    error = {};
    std::shared_ptr<SttEngine> engine = factory_(*model, catalog_.resolve_path(model_id), error);
    if (!engine) {
        if (error.ok()) {
            error = Error::make(ErrorCode::EngineLoadFailed, "Failed to load model: " + model_id);
        }
        std::cerr << "[stt] " << error.describe() << std::endl;
        return nullptr;
    }

    engines_[model_id] = engine;
    std::cout << "[stt] Engine cached for model: " << model_id
              << " (" << engine_kind_name(model->engine) << ")" << std::endl;
    return engine;
}

void EngineCache::evict(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (engines_.erase(model_id) > 0) {
        std::cout << "[stt] Evicted engine for model: " << model_id << std::endl;
    }
}

bool EngineCache::contains(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.count(model_id) > 0;
}

size_t EngineCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.size();
}

} // namespace sobotta
