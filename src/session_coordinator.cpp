#include "voxkey/session_coordinator.hpp"
#include <iostream>

namespace voxkey {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Transcribing: return "transcribing";
    }
    return "unknown";
}

SessionCoordinator::SessionCoordinator(TranscriptionEngine& engine, AudioSource& audio)
    : engine_(engine)
    , audio_(audio)
    , events_(std::make_shared<Channel>()) {
}

SessionCoordinator::~SessionCoordinator() {
    stop();
}

void SessionCoordinator::add_observer(SessionObserver* observer) {
    if (observer) observers_.push_back(observer);
}

void SessionCoordinator::start() {
    if (running_.exchange(true)) return;

    events_->reopen();
    loop_thread_ = std::thread([this]() {
        run_loop();
    });
}

void SessionCoordinator::stop() {
    if (!running_.exchange(false)) return;

    events_->close();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    // Drop a half-finished session
    if (state_.load() == SessionState::Recording) {
        audio_.stop_capture();
    }
    deadline_.reset();
    set_state(SessionState::Idle);
}

void SessionCoordinator::post_edge(bool pressed) {
    SessionEvent event;
    event.kind = pressed ? SessionEvent::Kind::Press : SessionEvent::Kind::Release;
    events_->push(std::move(event));
}

void SessionCoordinator::initialize_engine(std::optional<std::filesystem::path> model_path) {
    std::weak_ptr<Channel> events = events_;
    engine_.initialize_async(std::move(model_path), [events](int status) {
        if (auto channel = events.lock()) {
            SessionEvent event;
            event.kind = SessionEvent::Kind::EngineInitialized;
            event.init_status = status;
            channel->push(std::move(event));
        }
    });
}

bool SessionCoordinator::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return state_.load() == SessionState::Idle;
    });
}

void SessionCoordinator::run_loop() {
    for (;;) {
        std::optional<SessionEvent> event;
        if (deadline_) {
            event = events_->pop_until(*deadline_);
        } else {
            event = events_->pop();
        }

        if (event) {
            handle(*event);
            continue;
        }
        if (events_->closed()) {
            return;
        }
        if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
            on_timeout();
        }
    }
}

void SessionCoordinator::handle(SessionEvent& event) {
    switch (event.kind) {
        case SessionEvent::Kind::Press:
            on_press();
            break;
        case SessionEvent::Kind::Release:
            on_release();
            break;
        case SessionEvent::Kind::TranscriptionDone:
            on_transcription_done(event);
            break;
        case SessionEvent::Kind::EngineInitialized:
            if (event.init_status != 0) {
                std::string reason = engine_.failure_reason();
                for (auto* observer : observers_) observer->on_initialization_failed(reason);
            }
            break;
    }
}

void SessionCoordinator::on_press() {
    // One session at a time; a second press is a duplicate or arrives mid-transcription
    if (state_.load() != SessionState::Idle) return;

    if (!audio_.start_capture()) {
        std::cerr << "Failed to start audio capture" << std::endl;
        for (auto* observer : observers_) {
            observer->on_transcription_failed(ErrorCode::AudioUnavailable, "audio capture did not start");
        }
        return;
    }

    ++session_id_;
    std::cout << "Recording..." << std::endl;
    set_state(SessionState::Recording);
    for (auto* observer : observers_) observer->on_recording_started();
}

void SessionCoordinator::on_release() {
    // Late release without a session
    if (state_.load() != SessionState::Recording) return;

    std::vector<float> samples = audio_.stop_capture();
    set_state(SessionState::Transcribing);
    for (auto* observer : observers_) observer->on_recording_stopped();

    std::cout << "Transcribing " << samples.size() << " samples..." << std::endl;

    if (timeout_.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + timeout_;
    }

    std::weak_ptr<Channel> events = events_;
    const uint64_t session_id = session_id_;
    engine_.transcribe_async(std::move(samples), [events, session_id](TranscriptionResult result) {
        if (auto channel = events.lock()) {
            SessionEvent event;
            event.kind = SessionEvent::Kind::TranscriptionDone;
            event.session_id = session_id;
            event.result = std::move(result);
            channel->push(std::move(event));
        }
    });
}

void SessionCoordinator::on_transcription_done(const SessionEvent& event) {
    if (state_.load() != SessionState::Transcribing || event.session_id != session_id_) {
        std::cerr << "Discarding late transcription for session " << event.session_id << std::endl;
        return;
    }
    deadline_.reset();

    const TranscriptionResult& result = event.result;
    if (result.success && !result.text.empty()) {
        for (auto* observer : observers_) observer->on_transcription(result);
    } else {
        ErrorCode error = result.success ? ErrorCode::None : result.error;
        std::string message = result.success ? "no speech recognized" : result.message;
        std::cerr << "Transcription produced no text: " << message << std::endl;
        for (auto* observer : observers_) observer->on_transcription_failed(error, message);
    }

    set_state(SessionState::Idle);
}

void SessionCoordinator::on_timeout() {
    deadline_.reset();
    if (state_.load() != SessionState::Transcribing) return;

    std::cerr << "Transcription timed out after " << timeout_.count() << "ms" << std::endl;
    for (auto* observer : observers_) {
        observer->on_transcription_failed(ErrorCode::TimedOut, "transcription timed out");
    }
    set_state(SessionState::Idle);
}

void SessionCoordinator::set_state(SessionState state) {
    SessionState previous = state_.exchange(state);
    if (previous == state) return;

    for (auto* observer : observers_) observer->on_state_changed(state);

    if (state == SessionState::Idle) {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }
}

} // namespace voxkey
