#pragma once

#include <string>

namespace sobotta {

enum class ErrorCode {
    None,
    DeviceUnavailable,
    UnsupportedFormat,
    AlreadyRecording,
    NotRecording,
    NoAudioCaptured,
    SessionNotFound,
    EmptyAudio,
    UnknownModel,
    ModelNotDownloaded,
    EngineLoadFailed,
    InferenceFailed,
    RemoteApiError,
    MissingApiKey,
    InvalidHotkeySpec,
    InvalidArgument,
    IoError
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
    long http_status = 0;  // Only set for RemoteApiError (0 = transport failure)

    bool ok() const { return code == ErrorCode::None; }

    // "<CodeName>: <message>", with the HTTP status for remote failures
    std::string describe() const;

    static Error make(ErrorCode code, std::string message);
    static Error remote(long status, std::string message);
};

} // namespace sobotta
