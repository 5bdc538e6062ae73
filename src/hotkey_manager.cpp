#include "voxkey/hotkey_manager.hpp"
#include <iostream>

namespace voxkey {

HotkeyManager::HotkeyManager(std::vector<std::unique_ptr<HotkeyBackend>> backends)
    : backends_(std::move(backends)) {
}

HotkeyManager::~HotkeyManager() {
    stop();
}

std::vector<std::unique_ptr<HotkeyBackend>> HotkeyManager::backends_for(HotkeyBackendKind kind) {
    std::vector<std::unique_ptr<HotkeyBackend>> backends;
    switch (kind) {
        case HotkeyBackendKind::Evdev:
            backends.push_back(make_evdev_backend());
            break;
        case HotkeyBackendKind::X11:
            backends.push_back(make_x11_backend());
            break;
        case HotkeyBackendKind::Auto:
            backends.push_back(make_evdev_backend());
            backends.push_back(make_x11_backend());
            break;
    }
    return backends;
}

void HotkeyManager::set_callback(HotkeyCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

bool HotkeyManager::start() {
    if (running_.load()) return true;

    detector_.reset();
    permission_denied_ = false;

    for (auto& backend : backends_) {
        bool started = backend->try_start(keycode_, [this](bool key_down) {
            on_level(key_down);
        });
        if (started) {
            active_ = backend.get();
            running_.store(true);
            std::cout << "Hotkey listener started (" << backend->name() << ", key " << keycode_ << ")" << std::endl;
            return true;
        }

        if (backend->permission_denied()) {
            permission_denied_ = true;
            std::cerr << "Hotkey backend " << backend->name()
                      << " unavailable: permission denied" << std::endl;
        } else {
            std::cerr << "Hotkey backend " << backend->name() << " unavailable" << std::endl;
        }
    }

    return false;
}

void HotkeyManager::stop() {
    if (!running_.load()) return;

    active_->stop();
    active_ = nullptr;
    running_.store(false);

    // The event thread is gone; close a press that will never see its release
    if (detector_.pressed()) {
        detector_.reset();
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) callback_(false);
    }
}

const char* HotkeyManager::active_backend() const {
    return active_ ? active_->name() : nullptr;
}

void HotkeyManager::on_level(bool key_down) {
    Edge edge = detector_.update(key_down);
    if (edge == Edge::None) return;

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) callback_(edge == Edge::Pressed);
}

} // namespace voxkey
