// Tests for the C interface

#include "voxkey/voxkey.h"
#include "voxkey/ffi.hpp"
#include "fakes.hpp"
#include <iostream>
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <fstream>

using namespace voxkey;
using voxkey::testing::FakeDownloader;
using voxkey::testing::FakeHotkeyBackend;
using voxkey::testing::FakeInferenceService;

static std::filesystem::path g_dir;
static FakeInferenceService* g_service = nullptr;
static FakeDownloader* g_downloader = nullptr;
static FakeHotkeyBackend* g_backend = nullptr;

static std::atomic<int> g_first_presses{0};
static std::atomic<int> g_first_releases{0};
static std::atomic<int> g_second_presses{0};
static std::atomic<int> g_second_releases{0};

static void first_callback(bool pressed) {
    if (pressed) ++g_first_presses; else ++g_first_releases;
}

static void second_callback(bool pressed) {
    if (pressed) ++g_second_presses; else ++g_second_releases;
}

static std::atomic<int> g_reentrant_presses{0};
static std::atomic<int> g_reentrant_releases{0};

// Stops the monitor from inside its own callback
static void shutdown_on_press(bool pressed) {
    if (pressed) {
        ++g_reentrant_presses;
        voxkey_shutdown_keyboard_monitor();
    } else {
        ++g_reentrant_releases;
    }
}

static bool wait_for_count(const std::atomic<int>& counter, int expected) {
    for (int i = 0; i < 200; ++i) {
        if (counter.load() >= expected) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

static void install_fakes(bool fail_load) {
    set_inference_service_factory([fail_load]() {
        auto service = std::make_unique<FakeInferenceService>();
        service->fail_load = fail_load;
        g_service = service.get();
        return std::unique_ptr<InferenceService>(std::move(service));
    });
    set_model_resolver_factory([]() {
        ModelResolverOptions options;
        options.base_url = "https://models.example";
        options.user_cache_dir = g_dir / "cache";
        options.app_data_dir = g_dir / "data";
        options.download_dir = g_dir / "downloads";
        auto downloader = std::make_unique<FakeDownloader>();
        g_downloader = downloader.get();
        return std::make_unique<ModelResolver>(options, std::move(downloader));
    });
}

void test_bad_input_returns_empty_string() {
    std::cout << "Testing null and empty input..." << std::endl;

    char* text = voxkey_transcribe(nullptr, 16000);
    assert(text != nullptr);
    assert(std::strlen(text) == 0);
    voxkey_free_string(text);

    float samples[4] = {0.0f, 0.1f, 0.2f, 0.3f};
    text = voxkey_transcribe(samples, 0);
    assert(text != nullptr && text[0] == '\0');
    voxkey_free_string(text);

    text = voxkey_transcribe(samples, -5);
    assert(text != nullptr && text[0] == '\0');
    voxkey_free_string(text);

    voxkey_free_string(nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_not_ready_before_init() {
    std::cout << "Testing transcribe before init..." << std::endl;

    assert(!voxkey_is_ready());
    std::vector<float> samples(1600, 0.0f);
    char* text = voxkey_transcribe(samples.data(), static_cast<int32_t>(samples.size()));
    assert(text != nullptr && text[0] == '\0');
    voxkey_free_string(text);

    std::cout << "  PASS" << std::endl;
}

void test_init_and_transcribe() {
    std::cout << "Testing init and transcribe..." << std::endl;

    auto model = g_dir / "model.bin";
    std::ofstream(model) << "ok\n";

    assert(voxkey_init(model.string().c_str()) == 0);
    assert(voxkey_is_ready());
    assert(g_service->load_calls == 1);

    // Second init is a no-op
    assert(voxkey_init(model.string().c_str()) == 0);
    assert(g_service->load_calls == 1);

    std::vector<float> samples(16000, 0.05f);
    char* text = voxkey_transcribe(samples.data(), static_cast<int32_t>(samples.size()));
    assert(text != nullptr);
    assert(std::string(text) == "hello world");
    voxkey_free_string(text);

    g_service->fail_transcribe = true;
    text = voxkey_transcribe(samples.data(), static_cast<int32_t>(samples.size()));
    assert(text != nullptr && text[0] == '\0');
    voxkey_free_string(text);
    g_service->fail_transcribe = false;

    std::cout << "  PASS" << std::endl;
}

void test_cleanup_and_reinit_with_download() {
    std::cout << "Testing cleanup then init without a path..." << std::endl;

    voxkey_cleanup();
    assert(!voxkey_is_ready());
    voxkey_cleanup();

    // Nothing in the default locations: downloaded
    assert(voxkey_init(nullptr) == 0);
    assert(voxkey_is_ready());
    assert(g_downloader->calls == 1);

    voxkey_cleanup();
    std::cout << "  PASS" << std::endl;
}

void test_failed_init() {
    std::cout << "Testing failed init..." << std::endl;

    release_engine();
    install_fakes(true);

    auto model = g_dir / "model.bin";
    assert(voxkey_init(model.string().c_str()) == -1);
    assert(!voxkey_is_ready());
    assert(voxkey_init(model.string().c_str()) == -1);
    assert(g_service->load_calls == 1);

    release_engine();
    std::cout << "  PASS" << std::endl;
}

void test_init_uses_configured_model_path() {
    std::cout << "Testing init without a path uses the config file..." << std::endl;

    auto configured = g_dir / "configured.bin";
    std::ofstream(configured) << "ok\n";
    auto config_file = g_dir / "config" / "voxkey" / "config";
    std::filesystem::create_directories(config_file.parent_path());
    std::ofstream(config_file) << "model_path = " << configured.string() << "\n";

    release_engine();
    install_fakes(false);

    assert(voxkey_init(nullptr) == 0);
    assert(voxkey_is_ready());
    assert(g_downloader->calls == 0);
    {
        std::lock_guard<std::mutex> lock(g_service->mutex);
        assert(g_service->loaded_files.size() == 1);
        assert(g_service->loaded_files[0] == configured.string());
    }

    release_engine();
    std::filesystem::remove(config_file);
    std::cout << "  PASS" << std::endl;
}

void test_keyboard_monitor() {
    std::cout << "Testing keyboard monitor callbacks..." << std::endl;

    set_hotkey_backend_factory([]() {
        std::vector<std::unique_ptr<HotkeyBackend>> backends;
        auto backend = std::make_unique<FakeHotkeyBackend>("fake");
        g_backend = backend.get();
        backends.push_back(std::move(backend));
        return backends;
    });

    voxkey_register_push_to_talk_callback(first_callback);
    assert(voxkey_init_keyboard_monitor());
    assert(voxkey_init_keyboard_monitor());
    assert(g_backend->start_calls == 1);

    g_backend->emit(true);
    g_backend->emit(true);
    assert(wait_for_count(g_first_presses, 1));

    // Replacing the callback moves delivery, without duplicates
    voxkey_register_push_to_talk_callback(second_callback);
    g_backend->emit(false);
    assert(wait_for_count(g_second_releases, 1));
    assert(g_first_releases == 0);

    // A held key is released on shutdown
    g_backend->emit(true);
    assert(wait_for_count(g_second_presses, 1));
    voxkey_shutdown_keyboard_monitor();
    assert(g_second_releases == 2);
    assert(g_first_presses == 1);

    voxkey_shutdown_keyboard_monitor();
    voxkey_register_push_to_talk_callback(nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_keyboard_monitor_shutdown_from_callback() {
    std::cout << "Testing shutdown from inside the callback..." << std::endl;

    voxkey_register_push_to_talk_callback(shutdown_on_press);
    assert(voxkey_init_keyboard_monitor());

    g_backend->emit(true);
    assert(wait_for_count(g_reentrant_presses, 1));
    // The held key is released as the monitor stops
    assert(wait_for_count(g_reentrant_releases, 1));
    assert(g_reentrant_presses == 1);

    // The monitor can be started again afterwards
    voxkey_register_push_to_talk_callback(nullptr);
    assert(voxkey_init_keyboard_monitor());
    voxkey_shutdown_keyboard_monitor();

    std::cout << "  PASS" << std::endl;
}

void test_keyboard_monitor_unavailable() {
    std::cout << "Testing keyboard monitor without a backend..." << std::endl;

    set_hotkey_backend_factory([]() {
        std::vector<std::unique_ptr<HotkeyBackend>> backends;
        backends.push_back(std::make_unique<FakeHotkeyBackend>("denied", false, true));
        return backends;
    });
    assert(!voxkey_init_keyboard_monitor());
    voxkey_shutdown_keyboard_monitor();

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== C Interface Test Suite ===" << std::endl << std::endl;

    g_dir = testing::make_temp_dir("ffi");
    setenv("XDG_CONFIG_HOME", (g_dir / "config").c_str(), 1);
    install_fakes(false);

    test_bad_input_returns_empty_string();
    test_not_ready_before_init();
    test_init_and_transcribe();
    test_cleanup_and_reinit_with_download();
    test_failed_init();
    test_init_uses_configured_model_path();
    test_keyboard_monitor();
    test_keyboard_monitor_shutdown_from_callback();
    test_keyboard_monitor_unavailable();

    std::filesystem::remove_all(g_dir);

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
