#include "voxkey/app.hpp"
#include "voxkey/config.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>

static voxkey::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE   Config file (default: " << voxkey::default_config_path() << ")\n"
              << "  -p, --model PATH    Model file or directory; skips every other location\n"
              << "  -m, --model-dir DIR Directory searched before the caches (env: VOXKEY_MODEL_DIR)\n"
              << "  -q, --quality MODE  Quality mode: fast, balanced, accurate, best (default: balanced)\n"
              << "  -t, --threads N     Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG Language code (default: en)\n"
              << "  -k, --keycode N     Hotkey evdev key code (default: " << voxkey::DEFAULT_HOTKEY << ", Right Alt)\n"
              << "  -b, --backend NAME  Hotkey backend: auto, evdev, x11 (default: auto)\n"
              << "  --timeout MS        Give up on a transcription after MS milliseconds, 0 = never\n"
              << "  --no-paste          Don't auto-paste, just copy to clipboard\n"
              << "  -h, --help          Show this help\n"
              << "\nHotkey:\n"
              << "  Hold the configured key to record, release to transcribe and type.\n"
              << "  The evdev backend needs read access to /dev/input (the 'input' group);\n"
              << "  the x11 backend works inside an X session without it.\n"
              << "\nModels:\n"
              << "  Searched in --model, then --model-dir, ~/.cache/voxkey/models and\n"
              << "  ~/.local/share/voxkey/models. Missing models are downloaded from\n"
              << "  https://huggingface.co/ggerganov/whisper.cpp and cached.\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    voxkey::Config config;

    // Config file first so command-line options win
    std::string config_path = voxkey::default_config_path();
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            config_path = argv[i + 1];
        }
    }
    voxkey::load_config_file(config_path, config);
    voxkey::apply_environment(config);

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;  // already applied
        }
        else if ((strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quality") == 0) && i + 1 < argc) {
            const char* mode = argv[++i];
            if (!voxkey::parse_model_quality(mode, config.model_quality)) {
                std::cerr << "Unknown quality mode: " << mode << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            config.model_path = argv[++i];
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            config.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            config.n_threads = std::atoi(argv[++i]);
            if (config.n_threads <= 0) config.n_threads = 4;
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.language = argv[++i];
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--keycode") == 0) && i + 1 < argc) {
            config.hotkey_keycode = static_cast<uint32_t>(std::atoi(argv[++i]));
        }
        else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--backend") == 0) && i + 1 < argc) {
            const char* name = argv[++i];
            if (!voxkey::parse_hotkey_backend(name, config.hotkey_backend)) {
                std::cerr << "Unknown hotkey backend: " << name << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            config.transcription_timeout_ms = std::atoi(argv[++i]);
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            config.auto_paste = false;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    voxkey::App app;
    g_app = &app;

    std::cout << "voxkey - push-to-talk dictation\n" << std::endl;
    std::cout << "Quality: " << voxkey::get_profile(config.model_quality).name << std::endl;
    std::cout << "Model: " << (config.model_path.empty() ? config.model_filename() : config.model_path) << std::endl;
    std::cout << "Threads: " << config.n_threads << std::endl;
    std::cout << "Language: " << config.language << std::endl;
    std::cout << "Auto-paste: " << (config.auto_paste ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        return 1;
    }

    int result = app.run();

    app.shutdown();
    g_app = nullptr;
    return result;
}
