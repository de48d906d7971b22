#pragma once

#include "audio_capture.hpp"
#include "capture_session.hpp"
#include "error.hpp"
#include "history.hpp"
#include "notifier.hpp"
#include "session_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace sobotta {

// What the hotkey state machine drives
class RecordingControl {
public:
    virtual ~RecordingControl() = default;
    virtual Error start_recording() = 0;
    virtual CaptureResult stop_recording() = 0;
    virtual bool is_recording() const = 0;
};

struct RecorderOptions {
    bool enable_level_meter = true;
    std::chrono::milliseconds level_interval{50};
    size_t level_window_samples = 2048;
};

// Owns at most one CaptureSession and turns finished recordings (or imported
// files) into preprocessed sessions in the SessionStore.
class Recorder : public RecordingControl {
public:
    Recorder(InputDeviceFactory device_factory,
             SessionStore& sessions,
             NotificationSink& notifier,
             AudioArtifactSink* artifacts = nullptr,
             RecorderOptions options = {});
    ~Recorder() override;

    Error start_recording() override;
    CaptureResult stop_recording() override;
    bool is_recording() const override { return recording_.load(); }

    // Preprocess a WAV file into a new session (format taken from its header)
    CaptureResult import_audio(const std::string& path);

private:
    CaptureResult store_session(const std::vector<float>& raw, int channels, int sample_rate);

    InputDeviceFactory device_factory_;
    SessionStore& sessions_;
    NotificationSink& notifier_;
    AudioArtifactSink* artifacts_;
    RecorderOptions options_;

    std::mutex mutex_;  // Serializes start/stop
    std::unique_ptr<CaptureSession> active_;
    std::atomic<bool> recording_{false};
};

} // namespace sobotta
