#pragma once

#include "voxkey/error.hpp"
#include "voxkey/inference_service.hpp"
#include "voxkey/model_resolver.hpp"
#include "voxkey/task_executor.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxkey {

enum class EngineState {
    Uninitialized,
    Initializing,
    Ready,
    Failed
};

const char* to_string(EngineState state);

struct TranscriptionResult {
    std::string text;
    float confidence = 0.0f;   // 0.0 - 1.0
    int64_t duration_ms = 0;
    bool success = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
};

// Owns an InferenceService and runs model resolution, loading and inference
// on its own executor thread. All entry points return immediately; results
// are delivered to the completion callback, usually on the executor thread.
//
// Initialization is collapsed: while a load is in flight every further
// initialize_async() call is completed by that same load. A failed engine
// stays Failed until cleanup_async().
class TranscriptionEngine {
public:
    using InitCallback = std::function<void(int status)>;   // 0 ok, -1 failed
    using ResultCallback = std::function<void(TranscriptionResult)>;
    using DoneCallback = std::function<void()>;

    TranscriptionEngine(std::unique_ptr<InferenceService> service,
                        std::unique_ptr<ModelResolver> resolver);
    ~TranscriptionEngine();

    TranscriptionEngine(const TranscriptionEngine&) = delete;
    TranscriptionEngine& operator=(const TranscriptionEngine&) = delete;

    void initialize_async(std::optional<std::filesystem::path> model_path, InitCallback done);

    // Fails fast with EngineNotReady unless Ready; never queues behind a load
    void transcribe_async(std::vector<float> samples, ResultCallback done);

    // Unloads the model and returns to Uninitialized after queued work finishes
    void cleanup_async(DoneCallback done);

    bool is_ready() const { return state_.load() == EngineState::Ready; }
    EngineState state() const { return state_.load(); }
    std::string failure_reason() const;
    std::filesystem::path model_file() const;

private:
    void run_initialization(const std::optional<std::filesystem::path>& model_path);
    void run_transcription(const std::vector<float>& samples, const ResultCallback& done);
    void run_cleanup();
    void finish_initialization(EngineState final_state, int status);

    std::unique_ptr<InferenceService> service_;
    std::unique_ptr<ModelResolver> resolver_;

    std::atomic<EngineState> state_{EngineState::Uninitialized};

    // Guards state transitions, waiters and diagnostics
    mutable std::mutex init_mutex_;
    std::vector<InitCallback> init_waiters_;
    std::string failure_reason_;
    std::filesystem::path model_file_;

    // Declared last so the worker stops before the members it uses go away
    TaskExecutor executor_;
};

} // namespace voxkey
