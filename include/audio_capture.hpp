#pragma once

#include "error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <portaudio.h>

namespace sobotta {

enum class SampleEncoding {
    Float32,  // passed through
    Int16     // converted via s / 32767
};

// Format reported by the device once its stream is running
struct DeviceFormat {
    int sample_rate = 0;
    int channels = 0;
    SampleEncoding encoding = SampleEncoding::Float32;
};

// Receives interleaved float samples from the device callback
using SampleSink = std::function<void(const float* data, size_t count)>;

// A thread-affine audio input. Constructed, opened, closed and destroyed on
// the same (capture) thread.
class InputDevice {
public:
    virtual ~InputDevice() = default;

    // Open the default input, negotiate its format and start streaming into sink
    virtual Error open(SampleSink sink, DeviceFormat& format) = 0;

    // Stop the stream. No sink calls are made after this returns.
    virtual void close() = 0;
};

using InputDeviceFactory = std::function<std::unique_ptr<InputDevice>()>;

// Convert signed 16-bit PCM to float in [-1, 1]
void convert_int16(const int16_t* in, size_t count, std::vector<float>& out);

class PortAudioInputDevice : public InputDevice {
public:
    PortAudioInputDevice(int max_channels = 2, int frames_per_buffer = 512);
    ~PortAudioInputDevice() override;

    PortAudioInputDevice(const PortAudioInputDevice&) = delete;
    PortAudioInputDevice& operator=(const PortAudioInputDevice&) = delete;

    Error open(SampleSink sink, DeviceFormat& format) override;
    void close() override;

private:
    static int pa_callback(const void* input, void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data);

    Error fail(ErrorCode code, const std::string& message);

    int max_channels_;
    int frames_per_buffer_;

    PaStream* stream_ = nullptr;
    bool pa_initialized_ = false;

    DeviceFormat format_;
    SampleSink sink_;
    std::vector<float> scratch_;  // int16 -> float conversion, callback only

    std::atomic<uint64_t> overflow_count_{0};
};

InputDeviceFactory portaudio_device_factory(int max_channels, int frames_per_buffer);

} // namespace sobotta
