#include "app.hpp"
#include "config.hpp"
#include "model_catalog.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

static sobotta::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -m, --model ID        Model id (default: whisper-base, see --list-models)\n"
              << "  -d, --data-dir DIR    Data directory (default: ~/.sobotta)\n"
              << "  -c, --config PATH     Settings file (default: <data-dir>/config.json)\n"
              << "  -l, --language LANG   Language code or auto (default: auto)\n"
              << "  -t, --threads N       CPU threads for local models (default: 4, max 8)\n"
              << "  -k, --hotkey SPEC     Hotkey, e.g. Alt+Space, RightAlt, Ctrl+Shift+R\n"
              << "  --mode MODE           push-to-talk or toggle (default: push-to-talk)\n"
              << "  --no-save-audio       Don't keep WAV copies of recordings\n"
              << "  --no-gpu              Run local models on the CPU only\n"
              << "  -f, --file PATH       Transcribe a WAV file and exit\n"
              << "  --list-models         Show available models and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nModels are looked up in <data-dir>/models/<model-id>/.\n"
              << "Cloud models read OPENAI_API_KEY / GROQ_API_KEY from the environment.\n"
              << std::endl;
}

static void list_models(const sobotta::Config& config) {
    sobotta::BuiltinModelCatalog catalog(config.models_dir());

    for (const auto& model : catalog.list()) {
        bool present = catalog.is_downloaded(model);
        std::cout << (model.id == config.model_id ? "* " : "  ")
                  << model.id << "  [" << sobotta::engine_kind_name(model.engine) << "]  "
                  << (model.languages.multilingual
                          ? std::to_string(model.languages.language_count) + " languages"
                          : std::string("English"))
                  << "  " << (present ? "downloaded" : "not downloaded") << std::endl;
        if (!present) {
            std::cout << "      -> " << catalog.resolve_path(model.id) << std::endl;
        }
    }
}

static bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || end == text) return false;
    out = static_cast<int>(value);
    return true;
}

int main(int argc, char* argv[]) {
    sobotta::Config config;

    // The settings file location depends on -d/-c, so find those first
    std::string config_path;
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--data-dir") == 0) {
            config.data_dir = argv[i + 1];
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            config_path = argv[i + 1];
        }
    }
    if (config_path.empty()) config_path = config.default_config_path();

    sobotta::Error err = sobotta::load_config_file(config_path, config);
    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }
    sobotta::apply_environment(config);

    std::string input_file;
    bool show_models = false;

    // Parse arguments (override the settings file)
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            config.model_id = argv[++i];
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--data-dir") == 0) && i + 1 < argc) {
            config.data_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;  // Already loaded
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            if (!parse_int(argv[++i], config.n_threads) || config.n_threads < 1) {
                std::cerr << "Invalid thread count: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.language = argv[++i];
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--hotkey") == 0) && i + 1 < argc) {
            config.hotkey = argv[++i];
        }
        else if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            config.recording_mode = argv[++i];
        }
        else if ((strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--file") == 0) && i + 1 < argc) {
            input_file = argv[++i];
        }
        else if (strcmp(argv[i], "--no-save-audio") == 0) {
            config.save_audio = false;
        }
        else if (strcmp(argv[i], "--no-gpu") == 0) {
            config.use_gpu = false;
        }
        else if (strcmp(argv[i], "--list-models") == 0) {
            show_models = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (show_models) {
        list_models(config);
        return 0;
    }

    // Catch bad values before touching any device
    sobotta::RecordingMode mode;
    err = sobotta::parse_recording_mode(config.recording_mode, mode);
    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }
    sobotta::HotkeyBinding binding;
    err = sobotta::parse_hotkey_spec(config.hotkey, binding);
    if (input_file.empty() && !err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    sobotta::App app;
    g_app = &app;

    if (input_file.empty()) {
        std::cout << "Sobotta - Voice to Text\n" << std::endl;
        std::cout << "Model: " << config.model_id << std::endl;
        std::cout << "Data: " << config.resolved_data_dir() << std::endl;
        std::cout << "Threads: " << config.n_threads << std::endl;
        std::cout << "Language: " << config.language << std::endl;
        std::cout << "Hotkey: " << config.hotkey << " (" << config.recording_mode << ")" << std::endl;
        std::cout << "Save audio: " << (config.save_audio ? "yes" : "no") << std::endl;
        std::cout << std::endl;
    }

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = input_file.empty() ? app.run() : app.transcribe_file(input_file);

    app.shutdown();
    g_app = nullptr;
    return result;
}
