#pragma once

#include "error.hpp"
#include "hotkey_manager.hpp"
#include "notifier.hpp"
#include "recorder.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace sobotta {

enum class RecordingMode {
    PushToTalk,  // Hold to record, release to stop
    Toggle       // Press to start, press again to stop
};

// "push-to-talk" or "toggle"
Error parse_recording_mode(const std::string& name, RecordingMode& out);
const char* recording_mode_name(RecordingMode mode);

enum class HotkeyState {
    Idle,
    Recording
};

// Turns raw key events into start/stop calls according to the current mode.
// The mode is read on every event, so it can change without rebinding.
class HotkeyController {
public:
    HotkeyController(RecordingControl& recorder,
                     NotificationSink& notifier,
                     HotkeyBinder* binder = nullptr);

    void set_mode(RecordingMode mode) { mode_.store(mode); }
    Error set_mode(const std::string& name);
    RecordingMode mode() const { return mode_.load(); }

    // Parse and validate first; the previous binding survives any failure
    Error rebind(const std::string& spec);

    // Entry point for the key listener
    void on_key_event(bool pressed);

    HotkeyState state() const;

private:
    void begin();
    void finish();

    RecordingControl& recorder_;
    NotificationSink& notifier_;
    HotkeyBinder* binder_;

    std::atomic<RecordingMode> mode_{RecordingMode::PushToTalk};
    std::mutex event_mutex_;  // One key event handled at a time
};

} // namespace sobotta
