#pragma once

#include "voxkey/config.hpp"
#include "voxkey/audio_capture.hpp"
#include "voxkey/transcription_engine.hpp"
#include "voxkey/session_coordinator.hpp"
#include "voxkey/hotkey_manager.hpp"
#include "voxkey/text_output.hpp"

#include <memory>
#include <atomic>
#include <string>

namespace voxkey {

enum class TrayState {
    Idle,
    Recording,
    Transcribing,
    Error
};

class App : public SessionObserver {
public:
    App();
    ~App() override;

    // Initialize all components. The model loads in the background.
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    SessionState state() const;

    // SessionObserver
    void on_state_changed(SessionState state) override;
    void on_recording_started() override;
    void on_recording_stopped() override;
    void on_transcription(const TranscriptionResult& result) override;
    void on_transcription_failed(ErrorCode error, const std::string& message) override;
    void on_initialization_failed(const std::string& reason) override;

private:
    Config config_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::unique_ptr<HotkeyManager> hotkey_;
    std::unique_ptr<TextOutput> output_;

    std::atomic<bool> should_quit_{false};
};

// Console stand-in for a tray icon
void update_tray_state(TrayState state);
void add_to_history(const std::string& text);

} // namespace voxkey
