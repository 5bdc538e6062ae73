#pragma once

#include "voxkey/inference_service.hpp"
#include "voxkey/config.hpp"

// Forward declare whisper types
struct whisper_context;

namespace voxkey {

// InferenceService backed by whisper.cpp
class WhisperService : public InferenceService {
public:
    WhisperService(int n_threads = 4, bool use_gpu = false);
    ~WhisperService() override;

    void load(const std::filesystem::path& model_file) override;
    InferenceOutput transcribe(const std::vector<float>& samples) override;
    void unload() override;

    void set_language(const std::string& lang) { language_ = lang; }
    void set_translate(bool translate) { translate_ = translate; }
    void set_profile(const TranscriptionProfile& profile) { profile_ = profile; }
    void set_sample_rate(int sample_rate) { sample_rate_ = sample_rate; }

private:
    // Average token probability of the last run
    float calculate_confidence() const;

    whisper_context* ctx_ = nullptr;
    int n_threads_;
    bool use_gpu_;
    int sample_rate_ = 16000;
    std::string language_ = "en";
    bool translate_ = false;
    TranscriptionProfile profile_ = PROFILE_BALANCED;
};

} // namespace voxkey
