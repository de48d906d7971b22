#pragma once

#include "audio_buffer.hpp"
#include "audio_capture.hpp"
#include "error.hpp"
#include "level_meter.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sobotta {

struct LevelMeterSettings {
    LevelMeter::LevelCallback callback;   // Empty = no meter
    std::chrono::milliseconds interval{50};
    size_t window_samples = 2048;
};

// One recording. The input device lives entirely on a dedicated capture
// thread: it is created, opened, closed and destroyed there. The caller only
// talks to that thread through the init handshake and the stop signal.
class CaptureSession {
public:
    explicit CaptureSession(InputDeviceFactory factory, LevelMeterSettings meter = {});
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Spawn the capture thread and wait until the device is streaming
    // (or has failed). On success buffer() carries the device format.
    Error start();

    // Signal stop, wait for the capture thread to close the stream and exit,
    // then take everything it wrote. Samples delivered before the stream
    // closed are all included.
    std::vector<float> stop();

    bool is_active() const { return active_; }

    const AudioBuffer& buffer() const { return buffer_; }
    const DeviceFormat& format() const { return format_; }

private:
    void run(std::promise<Error> ready);
    void request_stop();

    InputDeviceFactory factory_;
    LevelMeterSettings meter_settings_;

    AudioBuffer buffer_;       // 0/0 until the device reports its format
    DeviceFormat format_;      // Written by the capture thread before the handshake
    std::unique_ptr<LevelMeter> meter_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    std::thread thread_;
    bool active_ = false;
};

} // namespace sobotta
