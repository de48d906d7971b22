#pragma once

#include "error.hpp"
#include "model_catalog.hpp"
#include "transcriber.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sobotta {

// Builds a local engine for a catalog entry whose files are present
using EngineFactory = std::function<std::shared_ptr<SttEngine>(
    const ModelInfo& model, const std::string& model_dir, Error& error)>;

struct LocalEngineSettings {
    int n_threads = 4;
    bool use_gpu = true;
};

// Whisper or Parakeet by engine kind; remote kinds are rejected
EngineFactory local_engine_factory(LocalEngineSettings settings);

// One loaded engine per model id, shared by all callers until evicted
class EngineCache {
public:
    EngineCache(const ModelCatalog& catalog, EngineFactory factory);

    // nullptr with error set on UnknownModel, ModelNotDownloaded or EngineLoadFailed
    std::shared_ptr<SttEngine> get_or_load(const std::string& model_id, Error& error);

    // Next get_or_load reloads from disk (or fails if the files are gone)
    void evict(const std::string& model_id);

    bool contains(const std::string& model_id) const;
    size_t size() const;

private:
    const ModelCatalog& catalog_;
    EngineFactory factory_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SttEngine>> engines_;
};

} // namespace sobotta
