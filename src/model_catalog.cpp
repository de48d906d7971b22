#include "model_catalog.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace sobotta {

namespace {

const char* HF_WHISPER = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
const char* HF_PARAKEET_V2 =
    "https://huggingface.co/csukuangfj/sherpa-onnx-nemo-parakeet-tdt-0.6b-v2-int8/resolve/main";
const char* HF_PARAKEET_V3 =
    "https://huggingface.co/csukuangfj/sherpa-onnx-nemo-parakeet-tdt-0.6b-v3-int8/resolve/main";

ModelInfo whisper_model(const std::string& size, const std::string& name,
                        uint64_t bytes, const std::string& description) {
    ModelInfo m;
    m.id = "whisper-" + size;
    m.name = name;
    m.engine = EngineKind::Whisper;
    m.size_bytes = bytes;
    m.files = {"ggml-" + size + ".bin"};
    m.download_urls = {std::string(HF_WHISPER) + "/" + m.files[0]};
    m.languages = {true, 99};
    m.description = description;
    return m;
}

ModelInfo parakeet_model(const std::string& version, const char* base,
                         LanguageSupport languages, const std::string& description) {
    ModelInfo m;
    m.id = "parakeet-tdt-0.6b-" + version;
    m.name = "Parakeet TDT 0.6B " + version;
    m.engine = EngineKind::Parakeet;
    m.size_bytes = 680000000;
    m.files = {
        "encoder-epoch-86-avg-1.int8.onnx",
        "decoder-epoch-86-avg-1.int8.onnx",
        "joiner-epoch-86-avg-1.int8.onnx",
        "tokens.txt",
    };
    for (const auto& f : m.files) {
        m.download_urls.push_back(std::string(base) + "/" + f);
    }
    m.languages = languages;
    m.description = description;
    return m;
}

ModelInfo cloud_model(const std::string& id, const std::string& name, EngineKind kind,
                      const std::string& description) {
    ModelInfo m;
    m.id = id;
    m.name = name;
    m.engine = kind;
    m.languages = {true, 99};
    m.description = description;
    return m;
}

} // namespace

const char* engine_kind_name(EngineKind kind) {
    switch (kind) {
        case EngineKind::Whisper: return "whisper";
        case EngineKind::Parakeet: return "parakeet";
        case EngineKind::CloudOpenAI: return "cloud-openai";
        case EngineKind::CloudGroq: return "cloud-groq";
    }
    return "unknown";
}

bool is_remote(EngineKind kind) {
    return kind == EngineKind::CloudOpenAI || kind == EngineKind::CloudGroq;
}

std::optional<ModelInfo> ModelCatalog::find(const std::string& model_id) const {
    auto models = list();
    auto it = std::find_if(models.begin(), models.end(),
                           [&](const ModelInfo& m) { return m.id == model_id; });
    if (it == models.end()) return std::nullopt;
    return *it;
}

BuiltinModelCatalog::BuiltinModelCatalog(std::string models_dir)
    : models_dir_(std::move(models_dir)) {
    models_ = {
        whisper_model("tiny", "Whisper Tiny", 77700000, "Fastest, least accurate. Good for testing."),
        whisper_model("base", "Whisper Base", 148000000, "Fast with reasonable accuracy."),
        whisper_model("small", "Whisper Small", 488000000, "Good balance of speed and accuracy."),
        whisper_model("medium", "Whisper Medium", 1530000000, "High accuracy, moderate speed."),
        whisper_model("large-v3-turbo", "Whisper Large V3 Turbo", 1620000000,
                      "Best quality with turbo speed improvements."),
        parakeet_model("v2", HF_PARAKEET_V2, {false, 1},
                       "NVIDIA Parakeet TDT v2 (INT8), English only, very fast."),
        parakeet_model("v3", HF_PARAKEET_V3, {true, 25},
                       "NVIDIA Parakeet TDT v3 (INT8), 25 European languages."),
        cloud_model("cloud-openai", "OpenAI Whisper API", EngineKind::CloudOpenAI,
                    "Hosted whisper-1, requires an OpenAI API key."),
        cloud_model("cloud-groq", "Groq Whisper API", EngineKind::CloudGroq,
                    "Hosted whisper-large-v3-turbo, requires a Groq API key."),
    };
}

std::vector<ModelInfo> BuiltinModelCatalog::list() const {
    return models_;
}

bool BuiltinModelCatalog::is_downloaded(const ModelInfo& model) const {
    if (is_remote(model.engine)) return true;

    std::filesystem::path dir = resolve_path(model.id);
    std::error_code ec;
    return std::all_of(model.files.begin(), model.files.end(), [&](const std::string& f) {
        return std::filesystem::exists(dir / f, ec);
    });
}

std::string BuiltinModelCatalog::resolve_path(const std::string& model_id) const {
    return (std::filesystem::path(models_dir_) / model_id).string();
}

} // namespace sobotta
