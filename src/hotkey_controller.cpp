#include "hotkey_controller.hpp"

#include <iostream>

namespace sobotta {

Error parse_recording_mode(const std::string& name, RecordingMode& out) {
    if (name == "push-to-talk" || name == "ptt") {
        out = RecordingMode::PushToTalk;
        return {};
    }
    if (name == "toggle") {
        out = RecordingMode::Toggle;
        return {};
    }
    return Error::make(ErrorCode::InvalidArgument,
                       "Unknown recording mode: " + name + " (expected push-to-talk or toggle)");
}

const char* recording_mode_name(RecordingMode mode) {
    return mode == RecordingMode::Toggle ? "toggle" : "push-to-talk";
}

HotkeyController::HotkeyController(RecordingControl& recorder,
                                   NotificationSink& notifier,
                                   HotkeyBinder* binder)
    : recorder_(recorder)
    , notifier_(notifier)
    , binder_(binder) {
}

Error HotkeyController::set_mode(const std::string& name) {
    RecordingMode mode;
    Error err = parse_recording_mode(name, mode);
    if (!err.ok()) return err;

    mode_.store(mode);
    std::cout << "[hotkey] Mode: " << recording_mode_name(mode) << std::endl;
    return {};
}

Error HotkeyController::rebind(const std::string& spec) {
    HotkeyBinding binding;
    Error err = parse_hotkey_spec(spec, binding);
    if (!err.ok()) return err;

    if (!binder_) {
        return Error::make(ErrorCode::InvalidHotkeySpec, "No hotkey listener to rebind");
    }
    return binder_->rebind(binding);
}

HotkeyState HotkeyController::state() const {
    // Derived from the recorder so a failed start or stop cannot leave it stale
    return recorder_.is_recording() ? HotkeyState::Recording : HotkeyState::Idle;
}

void HotkeyController::on_key_event(bool pressed) {
    std::lock_guard<std::mutex> lock(event_mutex_);

    const bool recording = recorder_.is_recording();

    if (mode_.load() == RecordingMode::Toggle) {
        if (!pressed) return;
        if (recording) finish();
        else begin();
        return;
    }

    // Push-to-talk
    if (pressed && !recording) {
        begin();
    } else if (!pressed && recording) {
        finish();
    }
}

void HotkeyController::begin() {
    Error err = recorder_.start_recording();
    if (err.ok()) {
        notifier_.indicator_visible(true);
        return;
    }

    std::cerr << "[hotkey] Failed to start recording: " << err.describe() << std::endl;
    notifier_.recording_error(err.describe());
    notifier_.indicator_visible(false);
    notifier_.recording_stopped(CaptureResult{});
}

void HotkeyController::finish() {
    CaptureResult result = recorder_.stop_recording();
    notifier_.indicator_visible(false);
    if (result.ok()) return;

    std::cerr << "[hotkey] Failed to stop recording: " << result.error.describe() << std::endl;
    notifier_.recording_error(result.error.describe());
    notifier_.recording_stopped(CaptureResult{});
}

} // namespace sobotta
