#include "voxkey/whisper_service.hpp"
#include "whisper.h"
#include <iostream>
#include <chrono>
#include <stdexcept>

namespace voxkey {

WhisperService::WhisperService(int n_threads, bool use_gpu)
    : n_threads_(n_threads)
    , use_gpu_(use_gpu) {
}

WhisperService::~WhisperService() {
    unload();
}

void WhisperService::load(const std::filesystem::path& model_file) {
    if (ctx_) unload();

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;

    ctx_ = whisper_init_from_file_with_params(model_file.string().c_str(), cparams);
    if (!ctx_) {
        throw std::runtime_error("whisper could not load " + model_file.string());
    }

    std::cout << "Loaded whisper model: " << model_file.string() << std::endl;
}

void WhisperService::unload() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

InferenceOutput WhisperService::transcribe(const std::vector<float>& samples) {
    if (!ctx_) {
        throw std::runtime_error("no whisper model loaded");
    }

    // Whisper requires minimum 100ms of audio - pad with silence if too short
    const float* data = samples.data();
    int n_samples = static_cast<int>(samples.size());
    std::vector<float> padded;
    int min_samples = sample_rate_ / 10;
    if (n_samples < min_samples) {
        padded = samples;
        padded.resize(min_samples, 0.0f);
        data = padded.data();
        n_samples = min_samples;
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(
        profile_.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY
    );

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = translate_;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = true;
    wparams.language         = language_.c_str();
    wparams.n_threads        = n_threads_;

    wparams.greedy.best_of        = profile_.best_of;
    wparams.beam_search.beam_size = profile_.beam_size;
    wparams.entropy_thold         = profile_.entropy_thold;
    wparams.no_speech_thold       = profile_.no_speech_thold;
    wparams.temperature           = profile_.temperature;
    wparams.logprob_thold         = -1.0f;

    int ret = whisper_full(ctx_, wparams, data, n_samples);
    if (ret != 0) {
        throw std::runtime_error("whisper_full returned " + std::to_string(ret));
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    if (start != std::string::npos && end != std::string::npos) {
        text = text.substr(start, end - start + 1);
    } else {
        text.clear();
    }

    InferenceOutput out;
    out.text = text;
    out.confidence = calculate_confidence();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    std::cout << "Inference [" << profile_.name << "] took " << elapsed << "ms (conf: "
              << static_cast<int>(out.confidence * 100) << "%)" << std::endl;

    return out;
}

float WhisperService::calculate_confidence() const {
    if (!ctx_) return 0.0f;

    const int n_segments = whisper_full_n_segments(ctx_);
    if (n_segments == 0) return 0.0f;

    float total_prob = 0.0f;
    int total_tokens = 0;

    for (int seg = 0; seg < n_segments; ++seg) {
        const int n_tokens = whisper_full_n_tokens(ctx_, seg);
        for (int tok = 0; tok < n_tokens; ++tok) {
            whisper_token_data token_data = whisper_full_get_token_data(ctx_, seg, tok);
            // Skip special tokens (negative IDs or zero probability)
            if (token_data.id >= 0 && token_data.p > 0.0f) {
                total_prob += token_data.p;
                total_tokens++;
            }
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

} // namespace voxkey
