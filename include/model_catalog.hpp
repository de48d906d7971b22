#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sobotta {

enum class EngineKind {
    Whisper,      // Local encoder-decoder (whisper.cpp)
    Parakeet,     // Local transducer (sherpa-onnx)
    CloudOpenAI,  // Remote A
    CloudGroq     // Remote B
};

const char* engine_kind_name(EngineKind kind);
bool is_remote(EngineKind kind);

struct LanguageSupport {
    bool multilingual = false;
    int language_count = 1;  // 1 = English only
};

struct ModelInfo {
    std::string id;
    std::string name;
    EngineKind engine = EngineKind::Whisper;
    uint64_t size_bytes = 0;
    std::vector<std::string> download_urls;
    std::vector<std::string> files;   // Relative to the model's directory
    LanguageSupport languages;
    std::string description;
};

class ModelCatalog {
public:
    virtual ~ModelCatalog() = default;

    virtual std::vector<ModelInfo> list() const = 0;

    // Remote models are always considered present
    virtual bool is_downloaded(const ModelInfo& model) const = 0;

    virtual std::string resolve_path(const std::string& model_id) const = 0;

    std::optional<ModelInfo> find(const std::string& model_id) const;
};

// Whisper, Parakeet and the two cloud entries. Local files live under
// <models_dir>/<model_id>/.
class BuiltinModelCatalog : public ModelCatalog {
public:
    explicit BuiltinModelCatalog(std::string models_dir);

    std::vector<ModelInfo> list() const override;
    bool is_downloaded(const ModelInfo& model) const override;
    std::string resolve_path(const std::string& model_id) const override;

    const std::string& models_dir() const { return models_dir_; }

private:
    std::string models_dir_;
    std::vector<ModelInfo> models_;
};

} // namespace sobotta
