#include "audio_capture.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace sobotta {

void convert_int16(const int16_t* in, size_t count, std::vector<float>& out) {
    if (out.size() < count) out.resize(count);

    constexpr float scale = static_cast<float>(std::numeric_limits<int16_t>::max());
    for (size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(in[i]) / scale;
    }
}

PortAudioInputDevice::PortAudioInputDevice(int max_channels, int frames_per_buffer)
    : max_channels_(max_channels)
    , frames_per_buffer_(frames_per_buffer) {
}

PortAudioInputDevice::~PortAudioInputDevice() {
    close();
}

Error PortAudioInputDevice::fail(ErrorCode code, const std::string& message) {
    std::cerr << "[capture] " << message << std::endl;
    close();
    return Error::make(code, message);
}

Error PortAudioInputDevice::open(SampleSink sink, DeviceFormat& format) {
    if (stream_) {
        return Error::make(ErrorCode::DeviceUnavailable, "Input stream already open");
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return fail(ErrorCode::DeviceUnavailable,
                    std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
    }
    pa_initialized_ = true;

    // Open default input device
    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) {
        return fail(ErrorCode::DeviceUnavailable, "No input device available");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels < 1) {
        return fail(ErrorCode::DeviceUnavailable, "Default input device has no input channels");
    }

    const int channels = std::min(info->maxInputChannels, std::max(1, max_channels_));
    const double sample_rate = info->defaultSampleRate;

    PaStreamParameters input_params;
    input_params.device = device;
    input_params.channelCount = channels;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    // Only float32 and int16 are accepted
    SampleEncoding encoding = SampleEncoding::Float32;
    if (Pa_IsFormatSupported(&input_params, nullptr, sample_rate) != paFormatIsSupported) {
        input_params.sampleFormat = paInt16;
        if (Pa_IsFormatSupported(&input_params, nullptr, sample_rate) != paFormatIsSupported) {
            return fail(ErrorCode::UnsupportedFormat,
                        std::string("Unsupported sample format on device: ") + info->name);
        }
        encoding = SampleEncoding::Int16;
    }

    format_.sample_rate = static_cast<int>(sample_rate);
    format_.channels = channels;
    format_.encoding = encoding;
    sink_ = std::move(sink);
    scratch_.assign(static_cast<size_t>(frames_per_buffer_) * channels, 0.0f);
    overflow_count_.store(0);

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        sample_rate,
                        frames_per_buffer_,
                        paClipOff,
                        pa_callback,
                        this);
    if (err != paNoError) {
        stream_ = nullptr;
        return fail(ErrorCode::DeviceUnavailable,
                    std::string("Failed to open stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        return fail(ErrorCode::DeviceUnavailable,
                    std::string("Failed to start stream: ") + Pa_GetErrorText(err));
    }

    std::cout << "[capture] Opened \"" << info->name << "\" at " << format_.sample_rate
              << "Hz, " << channels << " ch, "
              << (encoding == SampleEncoding::Float32 ? "f32" : "i16") << std::endl;

    format = format_;
    return {};
}

void PortAudioInputDevice::close() {
    if (stream_) {
        // Pa_StopStream returns after the last callback has completed
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError && err != paStreamIsStopped) {
            std::cerr << "[capture] Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            std::cerr << "[capture] Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
        }
        stream_ = nullptr;

        uint64_t overflows = overflow_count_.exchange(0);
        if (overflows > 0) {
            std::cerr << "[capture] " << overflows << " input overflow(s) during capture" << std::endl;
        }
    }

    if (pa_initialized_) {
        Pa_Terminate();
        pa_initialized_ = false;
    }
}

int PortAudioInputDevice::pa_callback(const void* input, void* output,
                                      unsigned long frame_count,
                                      const PaStreamCallbackTimeInfo* time_info,
                                      PaStreamCallbackFlags status_flags,
                                      void* user_data) {
    (void)output;
    (void)time_info;

    auto* device = static_cast<PortAudioInputDevice*>(user_data);

    // Stream problems are counted, not fatal
    if (status_flags & paInputOverflow) {
        device->overflow_count_.fetch_add(1, std::memory_order_relaxed);
    }

    if (!input || !device->sink_) return paContinue;

    const size_t count = static_cast<size_t>(frame_count) * device->format_.channels;

    if (device->format_.encoding == SampleEncoding::Float32) {
        device->sink_(static_cast<const float*>(input), count);
    } else {
        convert_int16(static_cast<const int16_t*>(input), count, device->scratch_);
        device->sink_(device->scratch_.data(), count);
    }

    return paContinue;
}

InputDeviceFactory portaudio_device_factory(int max_channels, int frames_per_buffer) {
    return [max_channels, frames_per_buffer]() -> std::unique_ptr<InputDevice> {
        return std::make_unique<PortAudioInputDevice>(max_channels, frames_per_buffer);
    };
}

} // namespace sobotta
