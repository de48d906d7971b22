#include "app.hpp"
#include "audio_capture.hpp"
#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace sobotta {

ControlCommand parse_control_command(const std::string& line) {
    ControlCommand command;

    size_t start = line.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return command;
    size_t end = line.find_last_not_of(" \t\r\n");
    std::string trimmed = line.substr(start, end - start + 1);

    size_t split = trimmed.find_first_of(" \t");
    std::string verb = trimmed.substr(0, split);
    for (auto& c : verb) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (split != std::string::npos) {
        command.argument = trimmed.substr(trimmed.find_first_not_of(" \t", split));
    }

    if (verb == "mode") {
        command.kind = ControlCommand::Kind::Mode;
    } else if (verb == "hotkey") {
        command.kind = ControlCommand::Kind::Hotkey;
    } else if (verb == "status") {
        command.kind = ControlCommand::Kind::Status;
    }
    return command;
}

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;

    catalog_ = std::make_unique<BuiltinModelCatalog>(config_.models_dir());

    auto model = catalog_->find(config_.model_id);
    if (!model) {
        std::cerr << "Unknown model: " << config_.model_id << " (see --list-models)" << std::endl;
        return false;
    }
    if (!catalog_->is_downloaded(*model)) {
        std::cerr << "Model " << model->id << " is not downloaded. Expected files in "
                  << catalog_->resolve_path(model->id) << ":" << std::endl;
        for (const auto& file : model->files) {
            std::cerr << "  " << file << std::endl;
        }
        return false;
    }
    if (model->engine == EngineKind::CloudOpenAI && config_.openai_api_key.empty()) {
        std::cerr << "cloud-openai needs an API key (OPENAI_API_KEY or config.json)" << std::endl;
        return false;
    }
    if (model->engine == EngineKind::CloudGroq && config_.groq_api_key.empty()) {
        std::cerr << "cloud-groq needs an API key (GROQ_API_KEY or config.json)" << std::endl;
        return false;
    }

    LocalEngineSettings engine_settings;
    engine_settings.n_threads = config_.n_threads;
    engine_settings.use_gpu = config_.use_gpu;
    engines_ = std::make_unique<EngineCache>(*catalog_, local_engine_factory(engine_settings));

    // Load the local model up front so the first dictation is not slow
    if (!is_remote(model->engine)) {
        Error err;
        if (!engines_->get_or_load(model->id, err)) {
            std::cerr << "Failed to load model: " << err.describe() << std::endl;
            return false;
        }
        std::cout << "Model loaded: " << model->name << std::endl;
    }

    // Create default vocabulary file if it doesn't exist (for user reference)
    vocabulary_ = std::make_unique<FileVocabularyStore>(config_.resolved_vocabulary_path());
    vocabulary_->create_default_file();

    if (config_.save_audio) {
        history_ = std::make_unique<WavHistorySink>(config_.audio_dir());
    }

    RecorderOptions recorder_options;
    recorder_options.level_interval = std::chrono::milliseconds(config_.level_interval_ms);
    recorder_options.level_window_samples = static_cast<size_t>(config_.level_window_samples);
    recorder_ = std::make_unique<Recorder>(
        portaudio_device_factory(config_.max_channels, config_.frames_per_buffer),
        sessions_, tray_, history_.get(), recorder_options);

    DispatcherOptions dispatcher_options;
    dispatcher_options.silence_rms_threshold = config_.silence_rms_threshold;
    dispatcher_options.release_session_after_transcribe = config_.release_session_after_transcribe;
    dispatcher_ = std::make_unique<SttDispatcher>(sessions_, *catalog_, *engines_,
                                                  remote_engine_factory(config_),
                                                  vocabulary_.get(), dispatcher_options);

    tray_.set_on_stopped([this](const CaptureResult& result) { on_recording_stopped(result); });

    worker_stop_ = false;
    worker_ = std::thread([this]() { transcription_loop(); });

    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    if (hotkey_) {
        hotkey_->stop();
    }

    // A recording in flight is still transcribed before the worker exits
    if (recorder_ && recorder_->is_recording()) {
        CaptureResult last = recorder_->stop_recording();
        if (!last.ok()) {
            std::cerr << "Discarding last recording: " << last.error.describe() << std::endl;
        }
    }

    if (worker_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            worker_stop_ = true;
        }
        queue_cv_.notify_all();
        worker_.join();
    }

    controller_.reset();
    recorder_.reset();
    if (hotkey_) {
        hotkey_->shutdown();
        hotkey_.reset();
    }
    dispatcher_.reset();
}

Error App::set_mode(const std::string& mode) {
    if (!controller_) {
        return Error::make(ErrorCode::InvalidArgument, "Hotkey controller not running");
    }
    return controller_->set_mode(mode);
}

Error App::rebind_hotkey(const std::string& spec) {
    if (!controller_) {
        return Error::make(ErrorCode::InvalidArgument, "Hotkey controller not running");
    }
    return controller_->rebind(spec);
}

int App::run() {
    HotkeyBinding binding;
    Error err = parse_hotkey_spec(config_.hotkey, binding);
    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }

    hotkey_ = std::make_unique<HotkeyManager>();
    if (!hotkey_->initialize()) {
        std::cerr << "Failed to initialize hotkey manager" << std::endl;
        return 1;
    }
    hotkey_->set_hotkey(binding);

    controller_ = std::make_unique<HotkeyController>(*recorder_, tray_, hotkey_.get());
    err = controller_->set_mode(config_.recording_mode);
    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }
    hotkey_->set_callback([this](bool pressed) { controller_->on_key_event(pressed); });

    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== Sobotta Ready ===" << std::endl;
    if (controller_->mode() == RecordingMode::PushToTalk) {
        std::cout << "Hold " << config_.hotkey << " to record, release to transcribe." << std::endl;
    } else {
        std::cout << "Press " << config_.hotkey << " to start recording, press again to transcribe." << std::endl;
    }
    tray_.set_state(AppState::Idle);

    std::cout << "Commands: mode <push-to-talk|toggle>, hotkey <combo>, status" << std::endl;

    bool stdin_open = true;
    while (!should_quit_.load()) {
        if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ret = poll(&pfd, 1, 100);
        if (ret <= 0) continue;  // Timeout or EINTR from the signal handler

        std::string line;
        if (!std::getline(std::cin, line)) {
            stdin_open = false;  // Detached or EOF, keep running on the hotkey alone
            continue;
        }
        handle_command(line);
    }

    return 0;
}

void App::handle_command(const std::string& line) {
    ControlCommand command = parse_control_command(line);
    Error err;

    switch (command.kind) {
        case ControlCommand::Kind::Mode:
            err = set_mode(command.argument);
            if (err.ok()) {
                std::cout << "[Sobotta] Mode: " << recording_mode_name(controller_->mode()) << std::endl;
            }
            break;
        case ControlCommand::Kind::Hotkey:
            err = rebind_hotkey(command.argument);
            if (err.ok()) {
                config_.hotkey = command.argument;
            }
            break;
        case ControlCommand::Kind::Status:
            std::cout << "[Sobotta] " << app_state_label(tray_.state())
                      << ", mode " << recording_mode_name(controller_->mode())
                      << ", hotkey " << describe_binding(hotkey_->hotkey()) << std::endl;
            break;
        case ControlCommand::Kind::Unknown:
            if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
                std::cerr << "Unknown command: " << line << std::endl;
            }
            break;
    }

    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
    }
}

int App::transcribe_file(const std::string& path) {
    CaptureResult capture = recorder_->import_audio(path);
    if (!capture.ok()) {
        std::cerr << "Import failed: " << capture.error.describe() << std::endl;
        return 1;
    }

    TranscriptionResult result = dispatcher_->transcribe(capture.session_id, config_.model_id,
                                                         transcription_options());
    if (!result.ok()) {
        std::cerr << "Transcription failed: " << result.error.describe() << std::endl;
        return 1;
    }

    if (result.language) {
        std::cerr << "Language: " << *result.language << std::endl;
    }
    std::cout << result.text << std::endl;
    return 0;
}

TranscriptionOptions App::transcription_options() const {
    TranscriptionOptions options;
    if (!config_.language.empty() && config_.language != "auto") {
        options.language = config_.language;
    }
    // Vocabulary comes from the store
    return options;
}

void App::on_recording_stopped(const CaptureResult& result) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(result.session_id);
    }
    queue_cv_.notify_one();
}

void App::transcription_loop() {
    while (true) {
        std::string session_id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return worker_stop_ || !queue_.empty(); });
            if (queue_.empty()) return;  // Stopped and drained
            session_id = queue_.front();
            queue_.pop_front();
        }

        tray_.set_state(AppState::Transcribing);

        TranscriptionResult result = dispatcher_->transcribe(session_id, config_.model_id,
                                                             transcription_options());
        if (!result.ok()) {
            tray_.recording_error(result.error.describe());
            // Nobody retries a hotkey session; the WAV artifact stays for history
            sessions_.remove(session_id);
        } else if (result.text.empty()) {
            std::cout << "[Sobotta] No speech detected" << std::endl;
        } else {
            std::cout << ">> " << result.text << std::endl;
        }

        if (!recorder_ || !recorder_->is_recording()) {
            tray_.set_state(AppState::Idle);
        }
    }
}

} // namespace sobotta
