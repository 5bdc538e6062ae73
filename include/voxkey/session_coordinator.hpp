#pragma once

#include "voxkey/audio_capture.hpp"
#include "voxkey/event_channel.hpp"
#include "voxkey/transcription_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voxkey {

enum class SessionState {
    Idle,
    Recording,
    Transcribing
};

const char* to_string(SessionState state);

// Receives session notifications. All calls arrive on the coordinator
// thread, in order, and must not block for long.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_state_changed(SessionState state) { (void)state; }
    virtual void on_recording_started() {}
    virtual void on_recording_stopped() {}
    virtual void on_transcription(const TranscriptionResult& result) { (void)result; }
    virtual void on_transcription_failed(ErrorCode error, const std::string& message) {
        (void)error;
        (void)message;
    }
    virtual void on_initialization_failed(const std::string& reason) { (void)reason; }
};

struct SessionEvent {
    enum class Kind {
        Press,
        Release,
        TranscriptionDone,
        EngineInitialized
    };

    Kind kind = Kind::Press;
    uint64_t session_id = 0;
    TranscriptionResult result;
    int init_status = 0;
};

// Runs push-to-talk sessions: Idle -> Recording -> Transcribing -> Idle.
// Hotkey edges and engine completions are queued and handled one at a time
// on the coordinator's own thread, so no state here needs a lock.
class SessionCoordinator {
public:
    SessionCoordinator(TranscriptionEngine& engine, AudioSource& audio);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    // Observers must be added before start() and outlive the coordinator
    void add_observer(SessionObserver* observer);

    // Zero waits for the engine forever
    void set_transcription_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    void start();
    void stop();

    // Safe from any thread, never blocks
    void post_edge(bool pressed);

    // Starts engine initialization; failure is reported to observers
    void initialize_engine(std::optional<std::filesystem::path> model_path);

    SessionState state() const { return state_.load(); }
    bool wait_until_idle(std::chrono::milliseconds timeout);

private:
    using Channel = EventChannel<SessionEvent>;

    void run_loop();
    void handle(SessionEvent& event);
    void on_press();
    void on_release();
    void on_transcription_done(const SessionEvent& event);
    void on_timeout();
    void set_state(SessionState state);

    TranscriptionEngine& engine_;
    AudioSource& audio_;
    std::vector<SessionObserver*> observers_;

    // Shared with engine callbacks, which may outlive a stopped coordinator
    std::shared_ptr<Channel> events_;
    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::atomic<SessionState> state_{SessionState::Idle};

    // Coordinator thread only
    uint64_t session_id_ = 0;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::chrono::milliseconds timeout_{0};

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace voxkey
