#pragma once

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace sobotta {

struct TranscriptionOptions {
    std::optional<std::string> language;  // ISO code, "auto" or unset = detect
    std::vector<std::string> vocabulary;  // Bias terms, in order

    bool auto_language() const { return !language || language->empty() || *language == "auto"; }
};

struct Segment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;
};

struct TranscriptionResult {
    std::string text;
    std::optional<std::string> language;  // Detected or forced
    std::vector<Segment> segments;
    int64_t duration_ms = 0;              // Inference time
    Error error;

    bool ok() const { return error.ok(); }

    static TranscriptionResult failure(Error error) {
        TranscriptionResult result;
        result.error = std::move(error);
        return result;
    }
};

// A speech-to-text backend. Audio is always 16kHz mono float.
class SttEngine {
public:
    virtual ~SttEngine() = default;

    virtual TranscriptionResult transcribe(const std::vector<float>& audio,
                                           const TranscriptionOptions& options) = 0;

    virtual const char* name() const = 0;
};

} // namespace sobotta
