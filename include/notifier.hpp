#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "error.hpp"

namespace sobotta {

// Outcome of stopping a recording or importing a file
struct CaptureResult {
    std::string session_id;
    int64_t duration_ms = 0;    // At the processed 16kHz rate
    size_t sample_count = 0;    // Processed samples
    Error error;

    bool ok() const { return error.ok(); }
};

// Fire-and-forget events towards the UI. Implementations must not block.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void recording_started() = 0;

    // Also used with an empty result as a reset event after failures
    virtual void recording_stopped(const CaptureResult& result) = 0;

    virtual void audio_level(float value) = 0;
    virtual void recording_error(const std::string& message) = 0;

    // Show/hide the recording indicator
    virtual void indicator_visible(bool visible) = 0;
};

// Drops everything
class NullNotificationSink : public NotificationSink {
public:
    void recording_started() override {}
    void recording_stopped(const CaptureResult&) override {}
    void audio_level(float) override {}
    void recording_error(const std::string&) override {}
    void indicator_visible(bool) override {}
};

} // namespace sobotta
