#include "voxkey/audio_capture.hpp"
#include <iostream>
#include <algorithm>

namespace voxkey {

AudioCapture::AudioCapture(int sample_rate, int channels, int frames_per_buffer, int max_seconds)
    : sample_rate_(sample_rate)
    , channels_(channels)
    , frames_per_buffer_(frames_per_buffer)
    , max_samples_(static_cast<size_t>(sample_rate) * static_cast<size_t>(max_seconds)) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "No default input device" << std::endl;
        Pa_Terminate();
        return false;
    }

    input_params.channelCount = channels_;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = Pa_GetDeviceInfo(input_params.device)->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        sample_rate_,
                        frames_per_buffer_,
                        paClipOff,
                        pa_callback,
                        this);

    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_Terminate();
        return false;
    }

    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    if (recording_.load()) {
        stop_capture();
    }

    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    Pa_Terminate();
    initialized_.store(false);
}

bool AudioCapture::start_capture() {
    if (!initialized_.load() || recording_.load()) return false;

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        audio_buffer_.clear();
        audio_buffer_.reserve(max_samples_);
    }

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    recording_.store(true);
    return true;
}

std::vector<float> AudioCapture::stop_capture() {
    if (recording_.exchange(false)) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(buffer_mutex_);
    std::vector<float> samples;
    samples.swap(audio_buffer_);
    return samples;
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!capture->recording_.load() || !input) return paContinue;

    const float* in = static_cast<const float*>(input);

    std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
    size_t room = capture->max_samples_ - std::min(capture->max_samples_, capture->audio_buffer_.size());
    size_t n = std::min(room, static_cast<size_t>(frame_count));
    capture->audio_buffer_.insert(capture->audio_buffer_.end(), in, in + n);

    return paContinue;
}

} // namespace voxkey
