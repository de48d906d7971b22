#pragma once

#include "config.hpp"
#include "engine_cache.hpp"
#include "history.hpp"
#include "hotkey_controller.hpp"
#include "hotkey_manager.hpp"
#include "model_catalog.hpp"
#include "recorder.hpp"
#include "session_store.hpp"
#include "stt_dispatcher.hpp"
#include "tray.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sobotta {

// Line commands read from stdin while the hotkey loop runs
//   mode <push-to-talk|toggle>
//   hotkey <combo>
//   status
struct ControlCommand {
    enum class Kind { Mode, Hotkey, Status, Unknown };

    Kind kind = Kind::Unknown;
    std::string argument;
};

ControlCommand parse_control_command(const std::string& line);

class App {
public:
    App();
    ~App();

    // Initialize all components and warm up the configured model
    bool initialize(const Config& config);
    void shutdown();

    // Run the hotkey loop (blocking)
    int run();

    // Import a WAV file, transcribe it and print the text
    int transcribe_file(const std::string& path);

    // Stop the application (safe from a signal handler)
    void quit() { should_quit_.store(true); }

    AppState state() const { return tray_.state(); }

    // Runtime controls
    Error set_mode(const std::string& mode);
    Error rebind_hotkey(const std::string& spec);

private:
    void handle_command(const std::string& line);
    void on_recording_stopped(const CaptureResult& result);
    void transcription_loop();
    TranscriptionOptions transcription_options() const;

    Config config_;
    std::unique_ptr<BuiltinModelCatalog> catalog_;
    std::unique_ptr<EngineCache> engines_;
    SessionStore sessions_;
    std::unique_ptr<WavHistorySink> history_;
    std::unique_ptr<FileVocabularyStore> vocabulary_;
    ConsoleTray tray_;
    std::unique_ptr<Recorder> recorder_;
    std::unique_ptr<SttDispatcher> dispatcher_;
    std::unique_ptr<HotkeyManager> hotkey_;
    std::unique_ptr<HotkeyController> controller_;

    // Finished sessions waiting for transcription
    std::thread worker_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;
    bool worker_stop_ = false;

    std::atomic<bool> should_quit_{false};
};

} // namespace sobotta
