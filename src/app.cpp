#include "voxkey/app.hpp"
#include "voxkey/model_downloader.hpp"
#include "voxkey/model_resolver.hpp"
#include "voxkey/whisper_service.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace voxkey {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;

    audio_ = std::make_unique<AudioCapture>(
        config_.sample_rate,
        config_.channels,
        config_.frames_per_buffer,
        config_.max_recording_seconds
    );

    if (!audio_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    std::cout << "Audio capture initialized" << std::endl;

    auto service = std::make_unique<WhisperService>(config_.n_threads, config_.use_gpu);
    service->set_language(config_.language);
    service->set_translate(config_.translate);
    service->set_profile(get_profile(config_.model_quality));
    service->set_sample_rate(config_.sample_rate);

    auto resolver = std::make_unique<ModelResolver>(
        ModelResolver::default_options(config_),
        std::make_unique<CurlModelDownloader>()
    );

    engine_ = std::make_unique<TranscriptionEngine>(std::move(service), std::move(resolver));

    output_ = std::make_unique<TextOutput>(config_.auto_paste, config_.add_space_between_utterances);

    coordinator_ = std::make_unique<SessionCoordinator>(*engine_, *audio_);
    coordinator_->add_observer(this);
    coordinator_->set_transcription_timeout(std::chrono::milliseconds(config_.transcription_timeout_ms));
    coordinator_->start();

    // Model resolution may download; hotkeys work meanwhile and report not-ready
    std::optional<std::filesystem::path> model_path;
    if (!config_.model_path.empty()) {
        model_path = std::filesystem::path(config_.model_path);
    }
    coordinator_->initialize_engine(model_path);

    hotkey_ = std::make_unique<HotkeyManager>(HotkeyManager::backends_for(config_.hotkey_backend));
    hotkey_->set_hotkey(config_.hotkey_keycode);
    hotkey_->set_callback([this](bool pressed) {
        coordinator_->post_edge(pressed);
    });
    std::cout << "Hotkey manager initialized" << std::endl;

    update_tray_state(TrayState::Idle);
    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    if (hotkey_) {
        hotkey_->stop();
        hotkey_.reset();
    }

    if (coordinator_) {
        coordinator_->stop();
        coordinator_.reset();
    }

    if (output_) {
        output_->shutdown();
        output_.reset();
    }

    if (engine_) {
        engine_.reset();
    }

    if (audio_) {
        audio_->shutdown();
        audio_.reset();
    }
}

SessionState App::state() const {
    return coordinator_ ? coordinator_->state() : SessionState::Idle;
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        if (hotkey_->permission_denied()) {
            std::cerr << "Grant access with: sudo usermod -aG input $USER (then log in again)," << std::endl
                      << "or run under X11 with --backend x11." << std::endl;
        }
        return 1;
    }

    std::cout << "\n=== voxkey ready ===" << std::endl;
    std::cout << "Hold the hotkey to record, release to transcribe and type.\n" << std::endl;

    while (!should_quit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

void App::on_state_changed(SessionState state) {
    switch (state) {
        case SessionState::Idle: update_tray_state(TrayState::Idle); break;
        case SessionState::Recording: update_tray_state(TrayState::Recording); break;
        case SessionState::Transcribing: update_tray_state(TrayState::Transcribing); break;
    }
}

void App::on_recording_started() {
    std::cout << "Recording started" << std::endl;
}

void App::on_recording_stopped() {
    std::cout << "Recording stopped" << std::endl;
}

void App::on_transcription(const TranscriptionResult& result) {
    add_to_history(result.text);
    if (!output_->type_text(result.text)) {
        std::cerr << "Text output is shut down, dropping transcription" << std::endl;
    }
}

void App::on_transcription_failed(ErrorCode error, const std::string& message) {
    // Silence or a failed run types nothing
    if (error != ErrorCode::None) {
        std::cerr << "Transcription failed (" << to_string(error) << "): " << message << std::endl;
        update_tray_state(TrayState::Error);
    }
}

void App::on_initialization_failed(const std::string& reason) {
    std::cerr << "Speech model unavailable: " << reason << std::endl;
    std::cerr << "Place " << config_.model_filename() << " in a model directory or pass --model." << std::endl;
    update_tray_state(TrayState::Error);
}

} // namespace voxkey
