#include "recorder.hpp"
#include "audio_processor.hpp"
#include "config.hpp"
#include "wav_io.hpp"

#include <iostream>
#include <utility>

namespace sobotta {

Recorder::Recorder(InputDeviceFactory device_factory,
                   SessionStore& sessions,
                   NotificationSink& notifier,
                   AudioArtifactSink* artifacts,
                   RecorderOptions options)
    : device_factory_(std::move(device_factory))
    , sessions_(sessions)
    , notifier_(notifier)
    , artifacts_(artifacts)
    , options_(options) {
}

Recorder::~Recorder() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        active_->stop();
        active_.reset();
        recording_.store(false);
    }
}

Error Recorder::start_recording() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Checked before any device work
    if (active_) {
        return Error::make(ErrorCode::AlreadyRecording, "A recording is already in progress");
    }

    LevelMeterSettings meter;
    if (options_.enable_level_meter) {
        meter.callback = [this](float level) { notifier_.audio_level(level); };
        meter.interval = options_.level_interval;
        meter.window_samples = options_.level_window_samples;
    }

    auto session = std::make_unique<CaptureSession>(device_factory_, std::move(meter));
    Error err = session->start();
    if (!err.ok()) {
        std::cerr << "[recorder] Failed to start recording: " << err.describe() << std::endl;
        return err;
    }

    std::cout << "[recorder] Recording at " << session->buffer().sample_rate() << "Hz, "
              << session->buffer().channels() << " ch" << std::endl;

    active_ = std::move(session);
    recording_.store(true);
    notifier_.recording_started();
    return {};
}

CaptureResult Recorder::stop_recording() {
    std::vector<float> raw;
    int sample_rate = 0;
    int channels = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            CaptureResult result;
            result.error = Error::make(ErrorCode::NotRecording, "No active recording");
            return result;
        }

        raw = active_->stop();
        sample_rate = active_->buffer().sample_rate();
        channels = active_->buffer().channels();
        active_.reset();
        recording_.store(false);
    }

    if (raw.empty()) {
        CaptureResult result;
        result.error = Error::make(ErrorCode::NoAudioCaptured, "No audio was captured");
        std::cerr << "[recorder] " << result.error.describe() << std::endl;
        return result;
    }

    CaptureResult result = store_session(raw, channels, sample_rate);
    std::cout << "[recorder] Stopped: session=" << result.session_id
              << " duration=" << result.duration_ms << "ms samples=" << result.sample_count
              << std::endl;

    notifier_.recording_stopped(result);
    return result;
}

CaptureResult Recorder::import_audio(const std::string& path) {
    WavData wav;
    Error err = read_wav(path, wav);
    if (!err.ok()) {
        CaptureResult result;
        result.error = err;
        return result;
    }

    if (wav.samples.empty()) {
        CaptureResult result;
        result.error = Error::make(ErrorCode::NoAudioCaptured, "File contains no audio: " + path);
        return result;
    }

    CaptureResult result = store_session(wav.samples, wav.channels, wav.sample_rate);
    std::cout << "[recorder] Imported " << path << " (" << wav.sample_rate << "Hz, "
              << wav.channels << " ch) as session " << result.session_id << std::endl;
    return result;
}

CaptureResult Recorder::store_session(const std::vector<float>& raw, int channels, int sample_rate) {
    std::vector<float> processed = AudioProcessor::preprocess(raw, channels, sample_rate);

    CaptureResult result;
    result.session_id = generate_session_id();
    result.sample_count = processed.size();
    result.duration_ms = static_cast<int64_t>(processed.size()) * 1000 / TARGET_SAMPLE_RATE;

    if (artifacts_) {
        Error err = artifacts_->save_audio_artifact(result.session_id, processed, TARGET_SAMPLE_RATE);
        if (!err.ok()) {
            // The transcript does not depend on the saved copy
            std::cerr << "[recorder] Failed to save audio artifact: " << err.describe() << std::endl;
        }
    }

    sessions_.insert(result.session_id, std::move(processed));
    return result;
}

} // namespace sobotta
