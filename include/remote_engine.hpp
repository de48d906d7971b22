#pragma once

#include "model_catalog.hpp"
#include "transcriber.hpp"

#include <string>

namespace sobotta {

struct RemoteEndpoint {
    std::string provider;      // For messages: "openai", "groq"
    std::string url;           // .../audio/transcriptions
    std::string model;
    std::string api_key;
    int timeout_ms = 30000;
    bool reports_language = true;
};

RemoteEndpoint openai_endpoint(const std::string& api_key, const std::string& model, int timeout_ms);
RemoteEndpoint groq_endpoint(const std::string& api_key, const std::string& model, int timeout_ms);

// OpenAI-compatible transcription API: the audio is uploaded as a WAV file in
// a multipart form, vocabulary is sent as the prompt.
class RemoteEngine : public SttEngine {
public:
    explicit RemoteEngine(RemoteEndpoint endpoint);

    TranscriptionResult transcribe(const std::vector<float>& audio,
                                   const TranscriptionOptions& options) override;

    const char* name() const override { return endpoint_.provider.c_str(); }

    // Exposed for tests: turn a response body into a result
    static TranscriptionResult parse_response(const std::string& body, bool reports_language);
    static std::string error_message(const std::string& body);

private:
    RemoteEndpoint endpoint_;
};

} // namespace sobotta
