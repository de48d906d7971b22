// Tests for CaptureSession and Recorder against a fake input device

#include "capture_session.hpp"
#include "history.hpp"
#include "recorder.hpp"
#include "wav_io.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sobotta;

namespace {

struct FakeDeviceScript {
    Error open_error;                 // Returned by open() when set
    DeviceFormat format{16000, 1, SampleEncoding::Float32};
    std::vector<float> on_open;       // Delivered synchronously from open()
    bool stream = false;              // Keep delivering 0.5 chunks until close()

    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::mutex thread_mutex;
    std::thread::id device_thread;    // Thread that constructed the device
    bool same_thread = true;          // open/close ran on the constructing thread
};

class FakeInputDevice : public InputDevice {
public:
    explicit FakeInputDevice(FakeDeviceScript& script) : script_(script) {
        std::lock_guard<std::mutex> lock(script_.thread_mutex);
        script_.device_thread = std::this_thread::get_id();
    }

    ~FakeInputDevice() override { close(); }

    Error open(SampleSink sink, DeviceFormat& format) override {
        check_thread();
        script_.opened++;
        if (!script_.open_error.ok()) return script_.open_error;

        format = script_.format;
        if (!script_.on_open.empty()) {
            sink(script_.on_open.data(), script_.on_open.size());
        }
        if (script_.stream) {
            running_ = true;
            feeder_ = std::thread([this, sink]() {
                std::vector<float> chunk(256, 0.5f);
                while (running_.load()) {
                    sink(chunk.data(), chunk.size());
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            });
        }
        open_ = true;
        return {};
    }

    void close() override {
        if (!open_) return;
        check_thread();
        running_ = false;
        if (feeder_.joinable()) feeder_.join();
        open_ = false;
        script_.closed++;
    }

private:
    void check_thread() {
        std::lock_guard<std::mutex> lock(script_.thread_mutex);
        if (std::this_thread::get_id() != script_.device_thread) script_.same_thread = false;
    }

    FakeDeviceScript& script_;
    std::atomic<bool> running_{false};
    std::thread feeder_;
    bool open_ = false;
};

InputDeviceFactory fake_factory(FakeDeviceScript& script) {
    return [&script]() -> std::unique_ptr<InputDevice> {
        return std::make_unique<FakeInputDevice>(script);
    };
}

class RecordingNotifier : public NotificationSink {
public:
    void recording_started() override { started++; }
    void recording_stopped(const CaptureResult& result) override {
        std::lock_guard<std::mutex> lock(mutex);
        stopped.push_back(result);
    }
    void audio_level(float) override { levels++; }
    void recording_error(const std::string&) override { errors++; }
    void indicator_visible(bool) override {}

    std::atomic<int> started{0};
    std::atomic<int> levels{0};
    std::atomic<int> errors{0};
    std::mutex mutex;
    std::vector<CaptureResult> stopped;
};

std::string temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("sobotta_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

} // namespace

void test_session_thread_affinity() {
    std::cout << "Testing capture thread ownership..." << std::endl;

    FakeDeviceScript script;
    script.format = {48000, 2, SampleEncoding::Float32};
    script.on_open = std::vector<float>(960, 0.25f);

    CaptureSession session(fake_factory(script));
    assert(session.start().ok());
    assert(session.is_active());
    assert(session.buffer().sample_rate() == 48000 && session.buffer().channels() == 2
           && "Format comes from the device");

    {
        std::lock_guard<std::mutex> lock(script.thread_mutex);
        assert(script.device_thread != std::this_thread::get_id() && "Device built off the caller thread");
    }

    auto raw = session.stop();
    assert(raw.size() == 960 && "Everything delivered before close is drained");
    assert(!session.is_active());
    assert(script.closed == 1);
    assert(script.same_thread && "open/close stay on the capture thread");

    std::cout << "  PASS: Device lives on the capture thread" << std::endl;
}

void test_session_open_failure() {
    std::cout << "Testing device open failure..." << std::endl;

    FakeDeviceScript script;
    script.open_error = Error::make(ErrorCode::UnsupportedFormat, "u8 only");

    CaptureSession session(fake_factory(script));
    Error err = session.start();
    assert(err.code == ErrorCode::UnsupportedFormat && "Handshake carries the device error");
    assert(!session.is_active());

    CaptureSession no_device(InputDeviceFactory{});
    assert(no_device.start().code == ErrorCode::DeviceUnavailable);

    // A throwing factory still completes the handshake
    CaptureSession throwing([]() -> std::unique_ptr<InputDevice> {
        throw std::runtime_error("backend exploded");
    });
    Error thrown = throwing.start();
    assert(thrown.code == ErrorCode::DeviceUnavailable);
    assert(thrown.message.find("backend exploded") != std::string::npos);
    assert(!throwing.is_active());

    std::cout << "  PASS: Open failures reach start()" << std::endl;
}

void test_recorder_lifecycle() {
    std::cout << "Testing recorder start/stop..." << std::endl;

    FakeDeviceScript script;
    script.format = {48000, 2, SampleEncoding::Float32};
    script.on_open = std::vector<float>(96000, 0.1f);  // One second of stereo

    SessionStore sessions;
    RecordingNotifier notifier;
    std::string dir = temp_dir("recorder");
    WavHistorySink history(dir);
    RecorderOptions options;
    options.enable_level_meter = false;

    Recorder recorder(fake_factory(script), sessions, notifier, &history, options);

    assert(recorder.stop_recording().error.code == ErrorCode::NotRecording);

    assert(recorder.start_recording().ok());
    assert(recorder.is_recording());
    assert(notifier.started == 1);

    // Second start is an error and does not disturb the first session
    Error again = recorder.start_recording();
    assert(again.code == ErrorCode::AlreadyRecording);
    assert(recorder.is_recording());
    assert(script.opened == 1 && "No device work for the rejected start");

    CaptureResult result = recorder.stop_recording();
    assert(result.ok());
    assert(!recorder.is_recording());
    assert(result.sample_count == 16000 && "Stereo 48kHz second -> 16000 mono samples");
    assert(result.duration_ms == 1000);
    assert(!result.session_id.empty());

    auto audio = sessions.get(result.session_id);
    assert(audio && audio->size() == 16000);
    assert((*audio)[100] > 0.94f && (*audio)[100] < 0.96f && "Stored audio is normalized");

    {
        std::lock_guard<std::mutex> lock(notifier.mutex);
        assert(notifier.stopped.size() == 1);
        assert(notifier.stopped[0].session_id == result.session_id);
    }

    assert(std::filesystem::exists(history.path_for(result.session_id)) && "Artifact written");

    // The artifact imports back as a new session with the same length
    CaptureResult imported = recorder.import_audio(history.path_for(result.session_id));
    assert(imported.ok());
    assert(imported.session_id != result.session_id);
    assert(imported.sample_count == 16000);

    std::filesystem::remove_all(dir);
    std::cout << "  PASS: Recorder start/stop/import" << std::endl;
}

void test_no_audio_captured() {
    std::cout << "Testing stop with no samples..." << std::endl;

    FakeDeviceScript script;  // Opens but never delivers
    SessionStore sessions;
    RecordingNotifier notifier;
    Recorder recorder(fake_factory(script), sessions, notifier);

    assert(recorder.start_recording().ok());
    CaptureResult result = recorder.stop_recording();
    assert(result.error.code == ErrorCode::NoAudioCaptured);
    assert(!recorder.is_recording() && "Failed stop still ends the session");
    assert(sessions.size() == 0);

    // A new recording can start afterwards
    assert(recorder.start_recording().ok());
    (void)recorder.stop_recording();

    std::cout << "  PASS: Empty capture reported" << std::endl;
}

void test_failed_start_leaves_idle() {
    std::cout << "Testing failed start..." << std::endl;

    FakeDeviceScript script;
    script.open_error = Error::make(ErrorCode::DeviceUnavailable, "unplugged");
    SessionStore sessions;
    RecordingNotifier notifier;
    Recorder recorder(fake_factory(script), sessions, notifier);

    assert(recorder.start_recording().code == ErrorCode::DeviceUnavailable);
    assert(!recorder.is_recording());
    assert(notifier.started == 0);
    assert(recorder.stop_recording().error.code == ErrorCode::NotRecording);

    std::cout << "  PASS: Failed start leaves no active session" << std::endl;
}

void test_streaming_with_meter() {
    std::cout << "Testing streaming capture with level meter..." << std::endl;

    FakeDeviceScript script;
    script.stream = true;
    SessionStore sessions;
    RecordingNotifier notifier;
    RecorderOptions options;
    options.level_interval = std::chrono::milliseconds(5);
    options.level_window_samples = 512;

    Recorder recorder(fake_factory(script), sessions, notifier, nullptr, options);
    assert(recorder.start_recording().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    CaptureResult result = recorder.stop_recording();

    assert(result.ok());
    assert(result.sample_count > 0);
    assert(notifier.levels > 0 && "Levels emitted while recording");

    int levels_at_stop = notifier.levels;
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    assert(notifier.levels == levels_at_stop && "Meter stops with the session");

    std::cout << "  PASS: Streaming capture and metering" << std::endl;
}

void test_import_errors() {
    std::cout << "Testing import errors..." << std::endl;

    FakeDeviceScript script;
    SessionStore sessions;
    NullNotificationSink notifier;
    Recorder recorder(fake_factory(script), sessions, notifier);

    std::string dir = temp_dir("import");
    assert(recorder.import_audio(dir + "/missing.wav").error.code == ErrorCode::IoError);

    std::string empty = dir + "/empty.wav";
    assert(save_wav(empty, {}, 16000).ok());
    assert(recorder.import_audio(empty).error.code == ErrorCode::NoAudioCaptured);
    assert(sessions.size() == 0);

    std::filesystem::remove_all(dir);
    std::cout << "  PASS: Import errors" << std::endl;
}

int main() {
    std::cout << "\n=== Recorder Test Suite ===" << std::endl << std::endl;

    test_session_thread_affinity();
    test_session_open_failure();
    test_recorder_lifecycle();
    test_no_audio_captured();
    test_failed_start_leaves_idle();
    test_streaming_with_meter();
    test_import_errors();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
