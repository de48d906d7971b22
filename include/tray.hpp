#pragma once

#include "notifier.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace sobotta {

enum class AppState {
    Idle,
    Recording,
    Transcribing,
    Error
};

const char* app_state_label(AppState state);

// Console stand-in for a tray icon: prints state changes and a level bar.
class ConsoleTray : public NotificationSink {
public:
    using StoppedCallback = std::function<void(const CaptureResult&)>;

    ConsoleTray();

    // Called for every successful stop (after printing)
    void set_on_stopped(StoppedCallback callback) { on_stopped_ = std::move(callback); }

    void set_state(AppState state);
    AppState state() const { return state_.load(); }

    void recording_started() override;
    void recording_stopped(const CaptureResult& result) override;
    void audio_level(float value) override;
    void recording_error(const std::string& message) override;
    void indicator_visible(bool visible) override;

private:
    void end_level_line();

    StoppedCallback on_stopped_;
    std::atomic<AppState> state_{AppState::Idle};
    std::atomic<bool> indicator_{false};

    std::mutex output_mutex_;
    bool level_line_open_ = false;
    bool interactive_;
};

} // namespace sobotta
