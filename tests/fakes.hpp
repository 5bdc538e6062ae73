// Test doubles shared by the test executables

#pragma once

#include "voxkey/audio_capture.hpp"
#include "voxkey/hotkey_backend.hpp"
#include "voxkey/inference_service.hpp"
#include "voxkey/model_downloader.hpp"
#include "voxkey/session_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace voxkey {
namespace testing {

class FakeInferenceService : public InferenceService {
public:
    std::atomic<int> load_calls{0};
    std::atomic<int> transcribe_calls{0};
    std::atomic<int> unload_calls{0};

    std::string text = "hello world";
    float confidence = 0.94f;
    bool fail_load = false;
    bool fail_transcribe = false;
    std::chrono::milliseconds load_delay{0};
    std::chrono::milliseconds transcribe_delay{0};

    std::mutex mutex;
    std::vector<std::string> loaded_files;

    void load(const std::filesystem::path& model_file) override {
        ++load_calls;
        std::this_thread::sleep_for(load_delay);
        {
            std::lock_guard<std::mutex> lock(mutex);
            loaded_files.push_back(model_file.string());
        }
        if (fail_load) throw std::runtime_error("corrupt model");
    }

    InferenceOutput transcribe(const std::vector<float>& samples) override {
        (void)samples;
        ++transcribe_calls;
        std::this_thread::sleep_for(transcribe_delay);
        if (fail_transcribe) throw std::runtime_error("inference exploded");
        return {text, confidence};
    }

    void unload() override {
        ++unload_calls;
    }
};

// Loads only files whose contents are "ok"
inline void load_if_ok(const std::filesystem::path& file) {
    std::ifstream in(file);
    std::string content;
    std::getline(in, content);
    if (content != "ok") throw std::runtime_error("bad model file " + file.string());
}

class FakeDownloader : public ModelDownloader {
public:
    int calls = 0;
    bool fail = false;
    std::string last_url;

    std::filesystem::path download(const std::string& url,
                                   const std::filesystem::path& dest_dir,
                                   const std::string& filename) override {
        ++calls;
        last_url = url;
        if (fail) throw std::runtime_error("network unreachable");
        std::filesystem::create_directories(dest_dir);
        auto path = dest_dir / filename;
        std::ofstream(path) << "ok\n";
        return path;
    }
};

class FakeAudioSource : public AudioSource {
public:
    std::atomic<int> start_calls{0};
    std::atomic<int> stop_calls{0};
    bool fail_start = false;
    std::vector<float> samples = std::vector<float>(16000, 0.1f);

    bool start_capture() override {
        ++start_calls;
        return !fail_start;
    }

    std::vector<float> stop_capture() override {
        ++stop_calls;
        return samples;
    }
};

// Raw key levels are injected by the test through emit()
class FakeHotkeyBackend : public HotkeyBackend {
public:
    explicit FakeHotkeyBackend(const char* name, bool accept = true, bool denied = false)
        : name_(name), accept_(accept), denied_(denied) {}

    const char* name() const override { return name_; }

    bool try_start(uint32_t keycode, LevelSink sink) override {
        ++start_calls;
        keycode_ = keycode;
        if (!accept_) return false;
        sink_ = std::move(sink);
        running_ = true;
        return true;
    }

    void stop() override {
        ++stop_calls;
        running_ = false;
    }

    bool permission_denied() const override { return denied_; }

    void emit(bool key_down) {
        if (running_ && sink_) sink_(key_down);
    }

    int start_calls = 0;
    int stop_calls = 0;
    uint32_t keycode() const { return keycode_; }
    bool running() const { return running_; }

private:
    const char* name_;
    bool accept_;
    bool denied_;
    bool running_ = false;
    uint32_t keycode_ = 0;
    LevelSink sink_;
};

// Records observer calls as strings, in arrival order
class RecordingObserver : public SessionObserver {
public:
    void on_state_changed(SessionState state) override {
        record(std::string("state:") + to_string(state));
    }
    void on_recording_started() override { record("recording_started"); }
    void on_recording_stopped() override { record("recording_stopped"); }
    void on_transcription(const TranscriptionResult& result) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_confidence_ = result.confidence;
        }
        record("transcription:" + result.text);
    }
    void on_transcription_failed(ErrorCode error, const std::string& message) override {
        (void)message;
        record(std::string("failed:") + to_string(error));
    }
    void on_initialization_failed(const std::string& reason) override {
        (void)reason;
        record("init_failed");
    }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    float last_confidence() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_confidence_;
    }

    // Waits until an event equal to name has been recorded
    bool wait_for(const std::string& name, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& e : events_) {
                if (e == name) return true;
            }
            return false;
        });
    }

    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e == name) ++n;
        }
        return n;
    }

private:
    void record(std::string event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> events_;
    float last_confidence_ = 0.0f;
};

// Fresh empty directory under the system temp dir
inline std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("voxkey_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace testing
} // namespace voxkey
