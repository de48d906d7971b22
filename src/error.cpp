#include "error.hpp"

#include <utility>

namespace sobotta {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::AlreadyRecording: return "AlreadyRecording";
        case ErrorCode::NotRecording: return "NotRecording";
        case ErrorCode::NoAudioCaptured: return "NoAudioCaptured";
        case ErrorCode::SessionNotFound: return "SessionNotFound";
        case ErrorCode::EmptyAudio: return "EmptyAudio";
        case ErrorCode::UnknownModel: return "UnknownModel";
        case ErrorCode::ModelNotDownloaded: return "ModelNotDownloaded";
        case ErrorCode::EngineLoadFailed: return "EngineLoadFailed";
        case ErrorCode::InferenceFailed: return "InferenceFailed";
        case ErrorCode::RemoteApiError: return "RemoteApiError";
        case ErrorCode::MissingApiKey: return "MissingApiKey";
        case ErrorCode::InvalidHotkeySpec: return "InvalidHotkeySpec";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    if (ok()) return "ok";

    std::string out = error_code_name(code);
    if (code == ErrorCode::RemoteApiError && http_status != 0) {
        out += " (HTTP " + std::to_string(http_status) + ")";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

Error Error::make(ErrorCode code, std::string message) {
    Error err;
    err.code = code;
    err.message = std::move(message);
    return err;
}

Error Error::remote(long status, std::string message) {
    Error err = make(ErrorCode::RemoteApiError, std::move(message));
    err.http_status = status;
    return err;
}

} // namespace sobotta
