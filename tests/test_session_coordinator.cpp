// Tests for SessionCoordinator push-to-talk sessions

#include "voxkey/session_coordinator.hpp"
#include "fakes.hpp"
#include <iostream>
#include <cassert>
#include <future>
#include <fstream>

using namespace voxkey;
using voxkey::testing::FakeAudioSource;
using voxkey::testing::FakeDownloader;
using voxkey::testing::FakeInferenceService;
using voxkey::testing::RecordingObserver;

struct SessionFixture {
    std::filesystem::path dir;
    std::filesystem::path model;
    FakeInferenceService* service = nullptr;
    FakeAudioSource audio;
    RecordingObserver observer;
    std::unique_ptr<TranscriptionEngine> engine;
    std::unique_ptr<SessionCoordinator> coordinator;

    SessionFixture() {
        dir = testing::make_temp_dir("session");
        model = dir / "ggml-base.en.bin";
        std::ofstream(model) << "ok\n";

        ModelResolverOptions options;
        options.user_cache_dir = dir / "cache";
        options.app_data_dir = dir / "data";
        options.download_dir = dir / "downloads";

        auto fake_service = std::make_unique<FakeInferenceService>();
        service = fake_service.get();
        engine = std::make_unique<TranscriptionEngine>(
            std::move(fake_service),
            std::make_unique<ModelResolver>(options, std::make_unique<FakeDownloader>()));

        coordinator = std::make_unique<SessionCoordinator>(*engine, audio);
        coordinator->add_observer(&observer);
    }

    ~SessionFixture() {
        coordinator.reset();
        engine.reset();
        std::filesystem::remove_all(dir);
    }

    void load_model() {
        auto done = std::make_shared<std::promise<int>>();
        auto status = done->get_future();
        engine->initialize_async(model, [done](int result) {
            done->set_value(result);
        });
        assert(status.get() == 0);
    }
};

void test_end_to_end() {
    std::cout << "Testing press, speak, release..." << std::endl;

    SessionFixture f;
    f.load_model();
    f.coordinator->start();

    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("state:idle"));

    std::vector<std::string> expected = {
        "state:recording",
        "recording_started",
        "state:transcribing",
        "recording_stopped",
        "transcription:hello world",
        "state:idle"
    };
    assert(f.observer.events() == expected);
    assert(f.observer.last_confidence() > 0.93f && f.observer.last_confidence() < 0.95f);
    assert(f.audio.start_calls == 1);
    assert(f.audio.stop_calls == 1);
    assert(f.coordinator->state() == SessionState::Idle);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_double_press_starts_one_session() {
    std::cout << "Testing duplicate press..." << std::endl;

    SessionFixture f;
    f.load_model();
    f.coordinator->start();

    f.coordinator->post_edge(true);
    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("state:idle"));

    assert(f.observer.count("state:recording") == 1);
    assert(f.observer.count("recording_started") == 1);
    assert(f.audio.start_calls == 1);
    assert(f.service->transcribe_calls == 1);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_release_while_idle_is_ignored() {
    std::cout << "Testing release without a session..." << std::endl;

    SessionFixture f;
    f.load_model();
    f.coordinator->start();

    f.coordinator->post_edge(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(f.observer.events().empty());
    assert(f.audio.stop_calls == 0);

    // Still usable afterwards
    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("transcription:hello world"));

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_engine_not_ready() {
    std::cout << "Testing session before the model is loaded..." << std::endl;

    SessionFixture f;
    f.coordinator->start();

    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("state:idle"));
    assert(f.observer.count("failed:engine not ready") == 1);
    assert(f.observer.count("transcription:hello world") == 0);
    assert(f.service->transcribe_calls == 0);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_silence_types_nothing() {
    std::cout << "Testing empty transcription..." << std::endl;

    SessionFixture f;
    f.service->text = "";
    f.load_model();
    f.coordinator->start();

    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("state:idle"));
    assert(f.observer.count("failed:none") == 1);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_audio_unavailable() {
    std::cout << "Testing microphone failure..." << std::endl;

    SessionFixture f;
    f.audio.fail_start = true;
    f.load_model();
    f.coordinator->start();

    f.coordinator->post_edge(true);
    assert(f.observer.wait_for("failed:audio unavailable"));
    f.coordinator->post_edge(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(f.observer.count("state:recording") == 0);
    assert(f.coordinator->state() == SessionState::Idle);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_transcription_timeout() {
    std::cout << "Testing transcription timeout..." << std::endl;

    SessionFixture f;
    f.service->transcribe_delay = std::chrono::milliseconds(500);
    f.load_model();
    f.coordinator->set_transcription_timeout(std::chrono::milliseconds(100));
    f.coordinator->start();

    f.coordinator->post_edge(true);
    f.coordinator->post_edge(false);
    assert(f.observer.wait_for("failed:timed out"));
    assert(f.coordinator->wait_until_idle(std::chrono::milliseconds(1000)));

    // The late result is dropped
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    assert(f.observer.count("transcription:hello world") == 0);
    assert(f.coordinator->state() == SessionState::Idle);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_initialization_failure_reported() {
    std::cout << "Testing initialization failure notification..." << std::endl;

    SessionFixture f;
    f.coordinator->start();
    f.coordinator->initialize_engine(f.dir / "missing.bin");
    assert(f.observer.wait_for("init_failed"));
    assert(f.engine->state() == EngineState::Failed);

    f.coordinator->stop();
    std::cout << "  PASS" << std::endl;
}

void test_stop_mid_recording() {
    std::cout << "Testing stop while recording..." << std::endl;

    SessionFixture f;
    f.load_model();
    f.coordinator->start();
    f.coordinator->post_edge(true);
    assert(f.observer.wait_for("recording_started"));

    f.coordinator->stop();
    assert(f.coordinator->state() == SessionState::Idle);
    assert(f.audio.stop_calls == 1);
    assert(f.service->transcribe_calls == 0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Session Coordinator Test Suite ===" << std::endl << std::endl;

    test_end_to_end();
    test_double_press_starts_one_session();
    test_release_while_idle_is_ignored();
    test_engine_not_ready();
    test_silence_types_nothing();
    test_audio_unavailable();
    test_transcription_timeout();
    test_initialization_failure_reported();
    test_stop_mid_recording();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
