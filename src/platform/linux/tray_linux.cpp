#include "tray.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <unistd.h>

// Linux tray implementation - console only, no GUI dependencies

namespace sobotta {

const char* app_state_label(AppState state) {
    switch (state) {
        case AppState::Idle:
            return "Ready";
        case AppState::Recording:
            return "Recording...";
        case AppState::Transcribing:
            return "Transcribing...";
        case AppState::Error:
            return "Error";
    }
    return "";
}

ConsoleTray::ConsoleTray()
    : interactive_(isatty(STDOUT_FILENO) == 1) {
}

void ConsoleTray::end_level_line() {
    if (level_line_open_) {
        std::cout << std::endl;
        level_line_open_ = false;
    }
}

void ConsoleTray::set_state(AppState state) {
    state_.store(state);
    std::lock_guard<std::mutex> lock(output_mutex_);
    end_level_line();
    std::cout << "[Sobotta] " << app_state_label(state) << std::endl;
}

void ConsoleTray::recording_started() {
    set_state(AppState::Recording);
}

void ConsoleTray::recording_stopped(const CaptureResult& result) {
    // Empty result = reset after a failure
    if (result.session_id.empty()) {
        set_state(AppState::Idle);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        end_level_line();
        std::cout << "[Sobotta] Captured " << result.duration_ms << " ms ("
                  << result.sample_count << " samples), session " << result.session_id << std::endl;
    }

    if (on_stopped_) on_stopped_(result);
}

void ConsoleTray::audio_level(float value) {
    if (!interactive_ || !indicator_.load()) return;

    // ~-60dB..0dB mapped onto 30 cells
    float db = value > 0.0f ? 20.0f * std::log10(value) : -60.0f;
    int cells = static_cast<int>(std::round((std::max(db, -60.0f) + 60.0f) / 2.0f));
    cells = std::min(cells, 30);

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\r[level] " << std::string(cells, '#') << std::string(30 - cells, ' ') << std::flush;
    level_line_open_ = true;
}

void ConsoleTray::recording_error(const std::string& message) {
    state_.store(AppState::Error);
    std::lock_guard<std::mutex> lock(output_mutex_);
    end_level_line();
    std::cerr << "[Sobotta] Error: " << message << std::endl;
}

void ConsoleTray::indicator_visible(bool visible) {
    indicator_.store(visible);
    if (!visible) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        end_level_line();
    }
}

} // namespace sobotta
