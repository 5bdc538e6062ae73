#pragma once

#include <vector>
#include <atomic>
#include <mutex>
#include <portaudio.h>

namespace voxkey {

// Buffers microphone audio between start_capture() and stop_capture()
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool start_capture() = 0;

    // Stops buffering and hands over everything captured (16kHz mono float)
    virtual std::vector<float> stop_capture() = 0;
};

class AudioCapture : public AudioSource {
public:
    AudioCapture(int sample_rate = 16000, int channels = 1, int frames_per_buffer = 512,
                 int max_seconds = 30);
    ~AudioCapture() override;

    bool initialize();
    void shutdown();

    bool start_capture() override;
    std::vector<float> stop_capture() override;
    bool is_recording() const { return recording_.load(); }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    int sample_rate_;
    int channels_;
    int frames_per_buffer_;
    size_t max_samples_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};

    std::vector<float> audio_buffer_;
    std::mutex buffer_mutex_;
};

} // namespace voxkey
