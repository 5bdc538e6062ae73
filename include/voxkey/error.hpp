#pragma once

namespace voxkey {

enum class ErrorCode {
    None,
    PermissionDenied,   // Hotkey backend cannot read input devices
    ModelNotFound,
    ModelLoadFailed,
    DownloadFailed,
    EngineNotReady,
    InferenceFailed,
    InvalidArgument,
    AudioUnavailable,
    TimedOut
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::ModelNotFound: return "model not found";
        case ErrorCode::ModelLoadFailed: return "model load failed";
        case ErrorCode::DownloadFailed: return "download failed";
        case ErrorCode::EngineNotReady: return "engine not ready";
        case ErrorCode::InferenceFailed: return "inference failed";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::AudioUnavailable: return "audio unavailable";
        case ErrorCode::TimedOut: return "timed out";
    }
    return "unknown";
}

} // namespace voxkey
