#include "voxkey/ffi.hpp"
#include "voxkey/config.hpp"
#include "voxkey/model_downloader.hpp"
#include "voxkey/transcription_engine.hpp"
#include "voxkey/whisper_service.hpp"
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <future>
#include <mutex>

namespace voxkey {

namespace {

std::mutex g_engine_mutex;
InferenceServiceFactory g_service_factory;
ModelResolverFactory g_resolver_factory;
std::shared_ptr<TranscriptionEngine> g_engine;
std::string g_configured_model_path;   // model_path from the config file

Config load_host_config() {
    Config config;
    load_config_file(default_config_path(), config);
    apply_environment(config);
    return config;
}

std::unique_ptr<InferenceService> default_service(const Config& config) {
    auto service = std::make_unique<WhisperService>(config.n_threads, config.use_gpu);
    service->set_language(config.language);
    service->set_translate(config.translate);
    service->set_profile(get_profile(config.model_quality));
    service->set_sample_rate(config.sample_rate);
    return service;
}

std::unique_ptr<ModelResolver> default_resolver(const Config& config) {
    return std::make_unique<ModelResolver>(
        ModelResolver::default_options(config),
        std::make_unique<CurlModelDownloader>()
    );
}

// Creates the engine on first use
std::shared_ptr<TranscriptionEngine> acquire_engine() {
    std::lock_guard<std::mutex> lock(g_engine_mutex);
    if (!g_engine) {
        Config config = load_host_config();
        g_configured_model_path = config.model_path;
        auto service = g_service_factory ? g_service_factory() : default_service(config);
        auto resolver = g_resolver_factory ? g_resolver_factory() : default_resolver(config);
        g_engine = std::make_shared<TranscriptionEngine>(std::move(service), std::move(resolver));
    }
    return g_engine;
}

std::string configured_model_path() {
    std::lock_guard<std::mutex> lock(g_engine_mutex);
    return g_configured_model_path;
}

std::shared_ptr<TranscriptionEngine> existing_engine() {
    std::lock_guard<std::mutex> lock(g_engine_mutex);
    return g_engine;
}

char* copy_string(const std::string& text) {
    char* out = static_cast<char*>(std::malloc(text.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, text.data(), text.size());
    out[text.size()] = '\0';
    return out;
}

} // namespace

void set_inference_service_factory(InferenceServiceFactory factory) {
    std::lock_guard<std::mutex> lock(g_engine_mutex);
    g_service_factory = std::move(factory);
}

void set_model_resolver_factory(ModelResolverFactory factory) {
    std::lock_guard<std::mutex> lock(g_engine_mutex);
    g_resolver_factory = std::move(factory);
}

void release_engine() {
    std::shared_ptr<TranscriptionEngine> engine;
    {
        std::lock_guard<std::mutex> lock(g_engine_mutex);
        engine.swap(g_engine);
    }
    // Destroyed here, outside the lock, once no caller holds it
}

} // namespace voxkey

using namespace voxkey;

extern "C" int32_t voxkey_init(const char* model_path) {
    try {
        auto engine = acquire_engine();

        std::optional<std::filesystem::path> path;
        if (model_path && *model_path) {
            path = std::filesystem::path(model_path);
        } else {
            // Same precedence as the daemon: a configured path is explicit
            std::string configured = configured_model_path();
            if (!configured.empty()) path = std::filesystem::path(configured);
        }

        auto done = std::make_shared<std::promise<int>>();
        std::future<int> status = done->get_future();
        engine->initialize_async(std::move(path), [done](int result) {
            done->set_value(result);
        });
        return status.get() == 0 ? 0 : -1;
    } catch (const std::exception& e) {
        std::cerr << "voxkey_init: " << e.what() << std::endl;
        return -1;
    }
}

extern "C" char* voxkey_transcribe(const float* samples, int32_t sample_count) {
    if (!samples || sample_count <= 0) {
        return copy_string("");
    }

    try {
        auto engine = existing_engine();
        if (!engine || !engine->is_ready()) {
            return copy_string("");
        }

        std::vector<float> buffer(samples, samples + sample_count);
        auto done = std::make_shared<std::promise<TranscriptionResult>>();
        std::future<TranscriptionResult> pending = done->get_future();
        engine->transcribe_async(std::move(buffer), [done](TranscriptionResult result) {
            done->set_value(std::move(result));
        });

        TranscriptionResult result = pending.get();
        if (!result.success) {
            std::cerr << "voxkey_transcribe: " << to_string(result.error);
            if (!result.message.empty()) std::cerr << ": " << result.message;
            std::cerr << std::endl;
            return copy_string("");
        }
        return copy_string(result.text);
    } catch (const std::exception& e) {
        std::cerr << "voxkey_transcribe: " << e.what() << std::endl;
        return copy_string("");
    }
}

extern "C" void voxkey_free_string(char* str) {
    std::free(str);
}

extern "C" void voxkey_cleanup(void) {
    auto engine = existing_engine();
    if (!engine) return;

    try {
        auto done = std::make_shared<std::promise<void>>();
        std::future<void> finished = done->get_future();
        engine->cleanup_async([done]() {
            done->set_value();
        });
        finished.get();
    } catch (const std::exception& e) {
        std::cerr << "voxkey_cleanup: " << e.what() << std::endl;
    }
}

extern "C" bool voxkey_is_ready(void) {
    auto engine = existing_engine();
    return engine && engine->is_ready();
}
