// Tests for settings loading, error formatting, remote response parsing and
// stdin control commands

#include "app.hpp"
#include "config.hpp"
#include "error.hpp"
#include "remote_engine.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace sobotta;

std::string write_temp(const std::string& name, const std::string& content) {
    auto dir = std::filesystem::temp_directory_path() / "sobotta_config_test";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::ofstream(path) << content;
    return path.string();
}

void test_defaults() {
    std::cout << "Testing defaults..." << std::endl;

    Config config;
    assert(config.model_id == "whisper-base");
    assert(config.silence_rms_threshold == 0.01f);
    assert(config.recording_mode == "push-to-talk");

    config.data_dir = "/tmp/sobotta-data";
    assert(config.models_dir() == "/tmp/sobotta-data/models");
    assert(config.audio_dir() == "/tmp/sobotta-data/audio");
    assert(config.resolved_vocabulary_path() == "/tmp/sobotta-data/vocabulary.txt");

    std::cout << "  PASS: Defaults and derived paths" << std::endl;
}

void test_load_file() {
    std::cout << "Testing settings file..." << std::endl;

    Config config;
    assert(load_config_file("/nonexistent/sobotta/config.json", config).ok() && "Missing file is fine");

    std::string path = write_temp("config.json", R"({
        "model_id": "parakeet-tdt-0.6b-v2",
        "n_threads": 6,
        "use_gpu": false,
        "hotkey": "Ctrl+Shift+Space",
        "recording_mode": "toggle",
        "language": 42,
        "remote": { "groq": { "api_key": "gsk-test", "model": "distil-whisper" } }
    })");

    assert(load_config_file(path, config).ok());
    assert(config.model_id == "parakeet-tdt-0.6b-v2");
    assert(config.n_threads == 6);
    assert(!config.use_gpu);
    assert(config.hotkey == "Ctrl+Shift+Space");
    assert(config.recording_mode == "toggle");
    assert(config.language == "auto" && "Wrongly typed key keeps the default");
    assert(config.groq_api_key == "gsk-test" && config.groq_model == "distil-whisper");
    assert(config.openai_model == "whisper-1");

    std::string broken = write_temp("broken.json", "{ not json");
    assert(load_config_file(broken, config).code == ErrorCode::InvalidArgument);

    std::string array = write_temp("array.json", "[1, 2]");
    assert(load_config_file(array, config).code == ErrorCode::InvalidArgument);

    std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    std::cout << "  PASS: Settings file overlay" << std::endl;
}

void test_environment() {
    std::cout << "Testing environment keys..." << std::endl;

    setenv("OPENAI_API_KEY", "sk-env", 1);
    setenv("GROQ_API_KEY", "gsk-env", 1);

    Config config;
    config.groq_api_key = "gsk-file";
    apply_environment(config);
    assert(config.openai_api_key == "sk-env");
    assert(config.groq_api_key == "gsk-file" && "Configured keys win");

    unsetenv("OPENAI_API_KEY");
    unsetenv("GROQ_API_KEY");
    std::cout << "  PASS: Environment fills empty keys" << std::endl;
}

void test_error_describe() {
    std::cout << "Testing error descriptions..." << std::endl;

    Error ok;
    assert(ok.ok());

    Error busy = Error::make(ErrorCode::AlreadyRecording, "already");
    assert(!busy.ok());
    assert(busy.describe() == "AlreadyRecording: already");

    Error remote = Error::remote(401, "Invalid API key");
    assert(remote.code == ErrorCode::RemoteApiError && remote.http_status == 401);
    assert(remote.describe().find("401") != std::string::npos);
    assert(remote.describe().find("Invalid API key") != std::string::npos);

    assert(std::string(error_code_name(ErrorCode::InvalidHotkeySpec)) == "InvalidHotkeySpec");

    std::cout << "  PASS: Error descriptions" << std::endl;
}

void test_remote_parsing() {
    std::cout << "Testing remote response parsing..." << std::endl;

    const std::string body = R"({
        "text": " Hello world.",
        "language": "english",
        "segments": [
            {"start": 0.0, "end": 1.25, "text": " Hello"},
            {"start": 1.25, "end": 2.5, "text": " world."}
        ]
    })";

    auto openai = RemoteEngine::parse_response(body, true);
    assert(openai.ok());
    assert(openai.text == " Hello world.");
    assert(openai.language && *openai.language == "english");
    assert(openai.segments.size() == 2);
    assert(openai.segments[1].start_ms == 1250 && openai.segments[1].end_ms == 2500);

    auto groq = RemoteEngine::parse_response(body, false);
    assert(groq.ok() && !groq.language && "Provider without language reporting");

    assert(RemoteEngine::parse_response("<html>", true).error.code == ErrorCode::InferenceFailed);
    assert(RemoteEngine::parse_response(R"({"segments": []})", true).error.code == ErrorCode::InferenceFailed);

    // Badly typed segments never throw; the text survives
    auto odd = RemoteEngine::parse_response(R"({
        "text": "hi",
        "segments": [42, {"start": "0.0", "end": 1.5, "text": 7}, null]
    })", true);
    assert(odd.ok() && odd.text == "hi");
    assert(odd.segments.size() == 1 && "Non-object entries dropped");
    assert(odd.segments[0].start_ms == 0 && odd.segments[0].end_ms == 1500);
    assert(odd.segments[0].text.empty());

    assert(RemoteEngine::parse_response(R"({"text": "x", "segments": "none"})", true).ok());

    assert(RemoteEngine::error_message(R"({"error":{"message": "Invalid API key", "type": "auth"}})")
           == "Invalid API key");
    assert(RemoteEngine::error_message("Bad Gateway") == "Bad Gateway" && "Raw body when not JSON");

    std::cout << "  PASS: Response and error bodies" << std::endl;
}

void test_remote_without_key() {
    std::cout << "Testing remote engine without key..." << std::endl;

    RemoteEngine engine(openai_endpoint("", "", 1000));
    assert(std::string(engine.name()) == "openai");
    auto result = engine.transcribe(std::vector<float>(1600, 0.5f), {});
    assert(result.error.code == ErrorCode::MissingApiKey && "No request without a key");

    auto groq = groq_endpoint("k", "", 5000);
    assert(groq.model == "whisper-large-v3-turbo" && !groq.reports_language);

    std::cout << "  PASS: Missing key reported before any request" << std::endl;
}

void test_control_commands() {
    std::cout << "Testing control commands..." << std::endl;

    ControlCommand mode = parse_control_command("  MODE   toggle \n");
    assert(mode.kind == ControlCommand::Kind::Mode && mode.argument == "toggle");

    ControlCommand hotkey = parse_control_command("hotkey Ctrl + Shift + R");
    assert(hotkey.kind == ControlCommand::Kind::Hotkey);
    assert(hotkey.argument == "Ctrl + Shift + R" && "Key combo keeps its inner spaces");

    assert(parse_control_command("status").kind == ControlCommand::Kind::Status);
    assert(parse_control_command("mode").argument.empty());
    assert(parse_control_command("").kind == ControlCommand::Kind::Unknown);
    assert(parse_control_command("dance now").kind == ControlCommand::Kind::Unknown);

    std::cout << "  PASS: Commands parsed" << std::endl;
}

int main() {
    std::cout << "\n=== Config Test Suite ===" << std::endl << std::endl;

    test_defaults();
    test_load_file();
    test_environment();
    test_error_describe();
    test_remote_parsing();
    test_remote_without_key();
    test_control_commands();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
