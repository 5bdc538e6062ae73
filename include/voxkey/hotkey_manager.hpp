#pragma once

#include "voxkey/config.hpp"
#include "voxkey/edge_detector.hpp"
#include "voxkey/hotkey_backend.hpp"

#include <functional>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include <cstdint>

namespace voxkey {

class HotkeyManager {
public:
    using HotkeyCallback = std::function<void(bool pressed)>;

    // Strategies are tried in order by start()
    explicit HotkeyManager(std::vector<std::unique_ptr<HotkeyBackend>> backends);
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    // Backends for the configured kind: Auto is evdev then X11
    static std::vector<std::unique_ptr<HotkeyBackend>> backends_for(HotkeyBackendKind kind);

    // keycode is an evdev key code. Takes effect on the next start().
    void set_hotkey(uint32_t keycode) { keycode_ = keycode; }
    uint32_t hotkey() const { return keycode_; }

    // Invoked on the backend's event thread, once per edge. Must not block.
    void set_callback(HotkeyCallback callback);

    // Starts the first backend that accepts. Calling it again while running
    // is a no-op returning true. Returns false if no backend could start.
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Name of the running backend, or nullptr
    const char* active_backend() const;

    // True if a backend was rejected for lack of permission during the last start()
    bool permission_denied() const { return permission_denied_; }

private:
    void on_level(bool key_down);

    std::vector<std::unique_ptr<HotkeyBackend>> backends_;
    HotkeyBackend* active_ = nullptr;
    uint32_t keycode_ = DEFAULT_HOTKEY;
    bool permission_denied_ = false;
    std::atomic<bool> running_{false};

    // Touched only from the active backend's event thread
    EdgeDetector detector_;

    std::mutex callback_mutex_;
    HotkeyCallback callback_;
};

} // namespace voxkey
