#pragma once

#include <string>
#include <cstdint>
#include <linux/input-event-codes.h>

namespace voxkey {

// Quality modes for accuracy/speed tradeoff
enum class ModelQuality {
    Fast,       // tiny.en
    Balanced,   // base.en
    Accurate,   // small.en
    Best        // medium.en
};

// Decoding parameter profiles
struct TranscriptionProfile {
    int best_of;
    int beam_size;
    float entropy_thold;
    float no_speech_thold;
    float temperature;
    const char* name;
};

// best_of: number of candidates, beam_size: beam search width
// entropy_thold: skip if entropy > threshold, no_speech_thold: skip if no_speech prob > threshold
inline const TranscriptionProfile PROFILE_FAST = {1, 1, 2.4f, 0.6f, 0.0f, "Fast"};
inline const TranscriptionProfile PROFILE_BALANCED = {5, 5, 2.8f, 0.5f, 0.0f, "Balanced"};
inline const TranscriptionProfile PROFILE_ACCURATE = {5, 8, 3.0f, 0.4f, 0.0f, "Accurate"};
inline const TranscriptionProfile PROFILE_BEST = {5, 10, 3.0f, 0.35f, 0.0f, "Best"};

inline const TranscriptionProfile& get_profile(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return PROFILE_FAST;
        case ModelQuality::Balanced: return PROFILE_BALANCED;
        case ModelQuality::Accurate: return PROFILE_ACCURATE;
        case ModelQuality::Best: return PROFILE_BEST;
        default: return PROFILE_BALANCED;
    }
}

inline std::string get_model_filename(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return "ggml-tiny.en.bin";
        case ModelQuality::Balanced: return "ggml-base.en.bin";
        case ModelQuality::Accurate: return "ggml-small.en.bin";
        case ModelQuality::Best: return "ggml-medium.en.bin";
        default: return "ggml-base.en.bin";
    }
}

// Parses "fast", "balanced", "accurate", "best". Returns false on anything else.
bool parse_model_quality(const std::string& name, ModelQuality& out);

// Which hotkey strategy to use. Auto tries evdev first, then X11.
enum class HotkeyBackendKind {
    Auto,
    Evdev,
    X11
};

bool parse_hotkey_backend(const std::string& name, HotkeyBackendKind& out);

// Default push-to-talk key (evdev code)
constexpr uint32_t DEFAULT_HOTKEY = KEY_RIGHTALT;

struct Config {
    // Audio settings
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;    // Low latency buffer

    // Model resolution. An explicit path skips every other candidate;
    // model_dir is tried before the cache directories.
    std::string model_path;
    std::string model_dir;
    ModelQuality model_quality = ModelQuality::Balanced;
    std::string model_base_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    int n_threads = 4;              // CPU threads for inference
    bool use_gpu = false;

    std::string model_filename() const { return get_model_filename(model_quality); }

    // Hotkey
    uint32_t hotkey_keycode = DEFAULT_HOTKEY;
    HotkeyBackendKind hotkey_backend = HotkeyBackendKind::Auto;

    // Behavior
    bool auto_paste = true;
    bool add_space_between_utterances = true;
    int max_recording_seconds = 30;
    int transcription_timeout_ms = 60000;   // 0 waits forever

    bool translate = false;
    std::string language = "en";
};

// Default config file: $XDG_CONFIG_HOME/voxkey/config or ~/.config/voxkey/config
std::string default_config_path();

// Apply "key = value" lines from path onto config. A missing file is not an
// error. Unknown keys and bad values are reported and skipped.
bool load_config_file(const std::string& path, Config& config);

// Apply VOXKEY_MODEL_DIR if set
void apply_environment(Config& config);

} // namespace voxkey
