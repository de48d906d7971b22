#include "level_meter.hpp"
#include "audio_processor.hpp"

#include <utility>

namespace sobotta {

LevelMeter::LevelMeter(AudioBuffer buffer, LevelCallback callback,
                       std::chrono::milliseconds interval, size_t window_samples)
    : buffer_(std::move(buffer))
    , callback_(std::move(callback))
    , interval_(interval)
    , window_samples_(window_samples) {
}

LevelMeter::~LevelMeter() {
    stop();
}

void LevelMeter::start() {
    if (thread_.joinable()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this]() { run_loop(); });
}

void LevelMeter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void LevelMeter::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        float level = AudioProcessor::rms_energy(buffer_.tail(window_samples_));
        if (callback_) callback_(level);
        lock.lock();
    }
}

} // namespace sobotta
