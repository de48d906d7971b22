#include "remote_engine.hpp"
#include "config.hpp"
#include "vocabulary.hpp"
#include "wav_io.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace sobotta {

RemoteEndpoint openai_endpoint(const std::string& api_key, const std::string& model, int timeout_ms) {
    RemoteEndpoint ep;
    ep.provider = "openai";
    ep.url = "https://api.openai.com/v1/audio/transcriptions";
    ep.model = model.empty() ? "whisper-1" : model;
    ep.api_key = api_key;
    ep.timeout_ms = timeout_ms;
    ep.reports_language = true;
    return ep;
}

RemoteEndpoint groq_endpoint(const std::string& api_key, const std::string& model, int timeout_ms) {
    RemoteEndpoint ep;
    ep.provider = "groq";
    ep.url = "https://api.groq.com/openai/v1/audio/transcriptions";
    ep.model = model.empty() ? "whisper-large-v3-turbo" : model;
    ep.api_key = api_key;
    ep.timeout_ms = timeout_ms;
    ep.reports_language = false;
    return ep;
}

RemoteEngine::RemoteEngine(RemoteEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

TranscriptionResult RemoteEngine::transcribe(const std::vector<float>& audio,
                                             const TranscriptionOptions& options) {
    if (endpoint_.api_key.empty()) {
        return TranscriptionResult::failure(Error::make(
            ErrorCode::MissingApiKey, endpoint_.provider + ": no API key configured"));
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<uint8_t> wav;
    Error err = encode_wav(audio, TARGET_SAMPLE_RATE, wav);
    if (!err.ok()) {
        return TranscriptionResult::failure(err);
    }

    cpr::Multipart form{
        {"file", cpr::Buffer{wav.begin(), wav.end(), "audio.wav"}, "audio/wav"},
        {"model", endpoint_.model},
        {"response_format", "verbose_json"},
    };
    if (!options.auto_language()) {
        form.parts.emplace_back("language", *options.language);
    }
    if (!options.vocabulary.empty()) {
        form.parts.emplace_back("prompt", build_prompt(options.vocabulary));
    }

    std::cout << "[stt] " << endpoint_.provider << ": uploading " << wav.size()
              << " bytes (" << endpoint_.model << ")" << std::endl;

    cpr::Response resp = cpr::Post(
        cpr::Url{endpoint_.url},
        cpr::Header{{"Authorization", "Bearer " + endpoint_.api_key}},
        form,
        cpr::Timeout{endpoint_.timeout_ms});

    if (resp.error.code != cpr::ErrorCode::OK) {
        return TranscriptionResult::failure(
            Error::remote(0, endpoint_.provider + ": " + resp.error.message));
    }

    if (resp.status_code < 200 || resp.status_code >= 300) {
        return TranscriptionResult::failure(Error::remote(
            resp.status_code, endpoint_.provider + ": " + error_message(resp.text)));
    }

    TranscriptionResult result = parse_response(resp.text, endpoint_.reports_language);
    if (!result.ok()) {
        result.error.message = endpoint_.provider + ": " + result.error.message;
        return result;
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (!result.language && !options.auto_language()) {
        result.language = *options.language;
    }

    std::cout << "[stt] " << endpoint_.provider << ": " << result.segments.size()
              << " segments in " << result.duration_ms << "ms" << std::endl;
    return result;
}

TranscriptionResult RemoteEngine::parse_response(const std::string& body, bool reports_language) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return TranscriptionResult::failure(Error::make(
            ErrorCode::InferenceFailed, std::string("malformed response: ") + e.what()));
    }

    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        return TranscriptionResult::failure(
            Error::make(ErrorCode::InferenceFailed, "response has no text field"));
    }

    TranscriptionResult result;
    result.text = j["text"].get<std::string>();

    if (reports_language && j.contains("language") && j["language"].is_string()) {
        result.language = j["language"].get<std::string>();
    }

    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& s : j["segments"]) {
            // Entries of the wrong shape are dropped, the text is still good
            if (!s.is_object()) continue;

            Segment segment;
            if (s.contains("start") && s["start"].is_number()) {
                segment.start_ms = static_cast<int64_t>(s["start"].get<double>() * 1000.0);
            }
            if (s.contains("end") && s["end"].is_number()) {
                segment.end_ms = static_cast<int64_t>(s["end"].get<double>() * 1000.0);
            }
            if (s.contains("text") && s["text"].is_string()) {
                segment.text = s["text"].get<std::string>();
            }
            result.segments.push_back(std::move(segment));
        }
    }

    return result;
}

std::string RemoteEngine::error_message(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object() && j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
            if (e.is_string()) return e.get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // Not JSON, fall through to the raw body
    }
    return body;
}

} // namespace sobotta
