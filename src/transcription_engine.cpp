#include "voxkey/transcription_engine.hpp"
#include <iostream>
#include <chrono>

namespace voxkey {

const char* to_string(EngineState state) {
    switch (state) {
        case EngineState::Uninitialized: return "uninitialized";
        case EngineState::Initializing: return "initializing";
        case EngineState::Ready: return "ready";
        case EngineState::Failed: return "failed";
    }
    return "unknown";
}

TranscriptionEngine::TranscriptionEngine(std::unique_ptr<InferenceService> service,
                                         std::unique_ptr<ModelResolver> resolver)
    : service_(std::move(service))
    , resolver_(std::move(resolver)) {
}

TranscriptionEngine::~TranscriptionEngine() {
    executor_.shutdown();
    if (service_) {
        service_->unload();
    }
}

std::string TranscriptionEngine::failure_reason() const {
    std::lock_guard<std::mutex> lock(init_mutex_);
    return failure_reason_;
}

std::filesystem::path TranscriptionEngine::model_file() const {
    std::lock_guard<std::mutex> lock(init_mutex_);
    return model_file_;
}

void TranscriptionEngine::initialize_async(std::optional<std::filesystem::path> model_path,
                                           InitCallback done) {
    std::unique_lock<std::mutex> lock(init_mutex_);

    switch (state_.load()) {
        case EngineState::Ready:
            lock.unlock();
            done(0);
            return;
        case EngineState::Failed:
            lock.unlock();
            done(-1);
            return;
        case EngineState::Initializing:
            // Completed by the load already in flight
            init_waiters_.push_back(std::move(done));
            return;
        case EngineState::Uninitialized:
            break;
    }

    state_.store(EngineState::Initializing);
    failure_reason_.clear();
    init_waiters_.push_back(std::move(done));
    lock.unlock();

    std::cout << "Initializing transcription engine..." << std::endl;

    bool posted = executor_.post([this, model_path]() {
        run_initialization(model_path);
    });
    if (!posted) {
        {
            std::lock_guard<std::mutex> guard(init_mutex_);
            failure_reason_ = "engine is shutting down";
        }
        finish_initialization(EngineState::Failed, -1);
    }
}

void TranscriptionEngine::run_initialization(const std::optional<std::filesystem::path>& model_path) {
    ResolveResult resolved;
    try {
        resolved = resolver_->resolve(model_path, [this](const std::filesystem::path& file) {
            service_->load(file);
        });
    } catch (const std::exception& e) {
        resolved.success = false;
        resolved.error = ErrorCode::ModelLoadFailed;
        resolved.message = e.what();
    }

    if (!resolved.success) {
        std::string reason = std::string(to_string(resolved.error));
        if (!resolved.message.empty()) reason += ": " + resolved.message;
        std::cerr << "Transcription engine failed to initialize: " << reason << std::endl;
        {
            std::lock_guard<std::mutex> lock(init_mutex_);
            failure_reason_ = reason;
        }
        finish_initialization(EngineState::Failed, -1);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        model_file_ = resolved.model_file;
    }
    std::cout << "Transcription engine ready" << std::endl;
    finish_initialization(EngineState::Ready, 0);
}

void TranscriptionEngine::finish_initialization(EngineState final_state, int status) {
    std::vector<InitCallback> waiters;
    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        state_.store(final_state);
        waiters.swap(init_waiters_);
    }
    for (auto& waiter : waiters) {
        waiter(status);
    }
}

void TranscriptionEngine::transcribe_async(std::vector<float> samples, ResultCallback done) {
    if (!is_ready()) {
        TranscriptionResult result;
        result.error = ErrorCode::EngineNotReady;
        result.message = std::string("engine is ") + to_string(state_.load());
        done(std::move(result));
        return;
    }

    if (samples.empty()) {
        TranscriptionResult result;
        result.error = ErrorCode::InvalidArgument;
        result.message = "no audio samples";
        done(std::move(result));
        return;
    }

    // The executor owns the buffer for the duration of the request
    auto shared_samples = std::make_shared<std::vector<float>>(std::move(samples));
    auto shared_done = std::make_shared<ResultCallback>(std::move(done));
    bool posted = executor_.post([this, shared_samples, shared_done]() {
        run_transcription(*shared_samples, *shared_done);
    });
    if (!posted) {
        TranscriptionResult result;
        result.error = ErrorCode::EngineNotReady;
        result.message = "engine is shutting down";
        (*shared_done)(std::move(result));
    }
}

void TranscriptionEngine::run_transcription(const std::vector<float>& samples, const ResultCallback& done) {
    TranscriptionResult result;

    // cleanup_async() may have run since the request was queued
    if (!is_ready()) {
        result.error = ErrorCode::EngineNotReady;
        result.message = std::string("engine is ") + to_string(state_.load());
        done(std::move(result));
        return;
    }

    auto start_time = std::chrono::steady_clock::now();
    try {
        InferenceOutput output = service_->transcribe(samples);
        result.text = std::move(output.text);
        result.confidence = output.confidence;
        result.success = true;
    } catch (const std::exception& e) {
        std::cerr << "Transcription failed: " << e.what() << std::endl;
        result.text.clear();
        result.error = ErrorCode::InferenceFailed;
        result.message = e.what();
    }
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (result.success) {
        std::cout << "Transcription took " << result.duration_ms << "ms (conf: "
                  << static_cast<int>(result.confidence * 100) << "%): \"" << result.text << "\"" << std::endl;
    }

    done(std::move(result));
}

void TranscriptionEngine::cleanup_async(DoneCallback done) {
    auto shared_done = std::make_shared<DoneCallback>(std::move(done));
    bool posted = executor_.post([this, shared_done]() {
        run_cleanup();
        if (*shared_done) (*shared_done)();
    });
    if (!posted && *shared_done) {
        (*shared_done)();
    }
}

void TranscriptionEngine::run_cleanup() {
    EngineState previous = state_.load();
    if (previous == EngineState::Uninitialized) return;
    // A load queued after this cleanup owns the engine now
    if (previous == EngineState::Initializing) return;

    service_->unload();
    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        state_.store(EngineState::Uninitialized);
        failure_reason_.clear();
        model_file_.clear();
    }
    std::cout << "Transcription engine cleaned up" << std::endl;
}

} // namespace voxkey
