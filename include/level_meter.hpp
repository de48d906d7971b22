#pragma once

#include "audio_buffer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace sobotta {

// Periodically reports the RMS of the most recent window of a capture buffer.
// Read-only with respect to the buffer.
class LevelMeter {
public:
    using LevelCallback = std::function<void(float level)>;

    LevelMeter(AudioBuffer buffer, LevelCallback callback,
               std::chrono::milliseconds interval = std::chrono::milliseconds(50),
               size_t window_samples = 2048);
    ~LevelMeter();

    LevelMeter(const LevelMeter&) = delete;
    LevelMeter& operator=(const LevelMeter&) = delete;

    void start();

    // Returns within one RMS computation; never waits for a full interval
    void stop();

    bool is_running() const { return thread_.joinable(); }

private:
    void run_loop();

    AudioBuffer buffer_;
    LevelCallback callback_;
    std::chrono::milliseconds interval_;
    size_t window_samples_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread thread_;
};

} // namespace sobotta
