#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace voxkey {

struct InferenceOutput {
    std::string text;
    float confidence = 0.0f;    // 0.0 - 1.0
};

// Speech-to-text engine capability. Implementations throw std::runtime_error
// on failure; TranscriptionEngine converts those into results and state.
class InferenceService {
public:
    virtual ~InferenceService() = default;

    // Load a model file. Called only from the engine's executor.
    virtual void load(const std::filesystem::path& model_file) = 0;

    // Transcribe 16kHz mono float samples. Requires a loaded model.
    virtual InferenceOutput transcribe(const std::vector<float>& samples) = 0;

    // Release the loaded model. Safe to call when nothing is loaded.
    virtual void unload() = 0;
};

} // namespace voxkey
