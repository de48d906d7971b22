#include "capture_session.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace sobotta {

CaptureSession::CaptureSession(InputDeviceFactory factory, LevelMeterSettings meter)
    : factory_(std::move(factory))
    , meter_settings_(std::move(meter))
    , buffer_(0, 0) {
}

CaptureSession::~CaptureSession() {
    if (meter_) meter_->stop();
    request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

Error CaptureSession::start() {
    if (active_ || thread_.joinable()) {
        return Error::make(ErrorCode::AlreadyRecording, "Capture session already started");
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }

    std::promise<Error> ready;
    std::future<Error> ready_future = ready.get_future();

    thread_ = std::thread(&CaptureSession::run, this, std::move(ready));

    Error err = ready_future.get();
    if (!err.ok()) {
        thread_.join();
        return err;
    }

    // Same storage the capture thread writes into, now with the real format
    buffer_ = buffer_.with_format(format_.sample_rate, format_.channels);
    active_ = true;

    if (meter_settings_.callback) {
        meter_ = std::make_unique<LevelMeter>(buffer_, meter_settings_.callback,
                                              meter_settings_.interval,
                                              meter_settings_.window_samples);
        meter_->start();
    }

    return {};
}

std::vector<float> CaptureSession::stop() {
    if (meter_) {
        meter_->stop();
        meter_.reset();
    }

    request_stop();

    // The capture thread closes the stream before exiting, so joining is
    // the drain: no callback can append after this point.
    if (thread_.joinable()) {
        thread_.join();
    }
    active_ = false;

    return buffer_.take();
}

void CaptureSession::request_stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void CaptureSession::run(std::promise<Error> ready) {
    std::unique_ptr<InputDevice> device;
    DeviceFormat format;
    try {
        device = factory_ ? factory_() : nullptr;
        if (!device) {
            ready.set_value(Error::make(ErrorCode::DeviceUnavailable, "No input device available"));
            return;
        }

        AudioBuffer sink_buffer = buffer_;
        Error err = device->open([sink_buffer](const float* data, size_t count) mutable {
            sink_buffer.append(data, count);
        }, format);

        if (!err.ok()) {
            device.reset();
            ready.set_value(std::move(err));
            return;
        }
    } catch (const std::exception& e) {
        // start() is still waiting on the handshake
        std::cerr << "[capture] Device setup threw: " << e.what() << std::endl;
        device.reset();
        ready.set_value(Error::make(ErrorCode::DeviceUnavailable,
                                    std::string("Input device failed to open: ") + e.what()));
        return;
    }

    format_ = format;
    ready.set_value(Error{});

    // Block until stop; the stream stays alive on this thread
    {
        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait(lock, [this]() { return stop_requested_; });
    }

    device->close();
    device.reset();
    std::cout << "[capture] Stream closed" << std::endl;
}

} // namespace sobotta
