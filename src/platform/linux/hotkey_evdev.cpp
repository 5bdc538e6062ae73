#include "voxkey/hotkey_backend.hpp"
#include "voxkey/edge_detector.hpp"
#include <iostream>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <linux/input.h>
#include <libevdev/libevdev.h>

namespace voxkey {

namespace {

struct KeyboardDevice {
    int fd = -1;
    struct libevdev* dev = nullptr;
    std::string path;
};

class EvdevHotkeyBackend : public HotkeyBackend {
public:
    ~EvdevHotkeyBackend() override { stop(); }

    const char* name() const override { return "evdev"; }

    bool try_start(uint32_t keycode, LevelSink sink) override;
    void stop() override;
    bool permission_denied() const override { return permission_denied_; }

private:
    void run_loop();
    // Drains pending events. Returns false if the device went away.
    bool drain(KeyboardDevice& device);
    void close_devices();

    std::vector<KeyboardDevice> devices_;
    uint32_t keycode_ = 0;
    LevelSink sink_;
    DeviceLevels levels_;   // keyed by fd, listener thread only
    bool permission_denied_ = false;
    std::atomic<bool> running_{false};
    std::thread listener_thread_;
};

std::vector<std::string> list_event_devices() {
    std::vector<std::string> paths;
    std::error_code ec;
    for (auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            paths.push_back(entry.path().string());
        }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

bool EvdevHotkeyBackend::try_start(uint32_t keycode, LevelSink sink) {
    if (running_.load()) return true;

    keycode_ = keycode;
    sink_ = std::move(sink);
    levels_.clear();
    permission_denied_ = false;

    int denied = 0;
    for (const auto& path : list_event_devices()) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) ++denied;
            continue;
        }

        struct libevdev* dev = nullptr;
        if (libevdev_new_from_fd(fd, &dev) < 0) {
            close(fd);
            continue;
        }

        // Only keyboards that can produce the hotkey
        if (libevdev_has_event_type(dev, EV_KEY) &&
            libevdev_has_event_code(dev, EV_KEY, KEY_A) &&
            libevdev_has_event_code(dev, EV_KEY, keycode_)) {
            std::cout << "Using keyboard: " << path << " (" << libevdev_get_name(dev) << ")" << std::endl;
            devices_.push_back({fd, dev, path});
        } else {
            libevdev_free(dev);
            close(fd);
        }
    }

    if (devices_.empty()) {
        if (denied > 0) {
            permission_denied_ = true;
            std::cerr << "Cannot read input devices. Add your user to the 'input' group." << std::endl;
        } else {
            std::cerr << "No keyboard device with key " << keycode_ << " found" << std::endl;
        }
        return false;
    }

    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void EvdevHotkeyBackend::stop() {
    if (running_.exchange(false) && listener_thread_.joinable()) {
        listener_thread_.join();
    }
    close_devices();
}

void EvdevHotkeyBackend::close_devices() {
    for (auto& device : devices_) {
        if (device.dev) libevdev_free(device.dev);
        if (device.fd >= 0) close(device.fd);
    }
    devices_.clear();
}

void EvdevHotkeyBackend::run_loop() {
    while (running_.load()) {
        std::vector<struct pollfd> fds;
        fds.reserve(devices_.size());
        for (const auto& device : devices_) {
            fds.push_back({device.fd, POLLIN, 0});
        }
        if (fds.empty()) {
            std::cerr << "All keyboard devices disappeared, hotkey listener stopping" << std::endl;
            return;
        }

        int ret = poll(fds.data(), fds.size(), 100); // 100ms so stop() is noticed
        if (ret <= 0) continue;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (!(fds[i].revents & (POLLIN | POLLERR | POLLHUP))) continue;
            if (!drain(devices_[i])) {
                std::cerr << "Keyboard removed: " << devices_[i].path << std::endl;
                // A key held on the removed keyboard is no longer held
                sink_(levels_.remove(devices_[i].fd));
                libevdev_free(devices_[i].dev);
                close(devices_[i].fd);
                devices_[i].dev = nullptr;
                devices_[i].fd = -1;
            }
        }

        devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                      [](const KeyboardDevice& d) { return d.fd < 0; }),
                       devices_.end());
    }
}

bool EvdevHotkeyBackend::drain(KeyboardDevice& device) {
    struct input_event ev;
    unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;

    for (;;) {
        int rc = libevdev_next_event(device.dev, flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events: replay the device state
            flags = LIBEVDEV_READ_FLAG_SYNC;
        } else if (rc == -EAGAIN) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                flags = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            return true;
        } else if (rc != LIBEVDEV_READ_STATUS_SUCCESS) {
            return false;
        }

        // value: 1 press, 2 autorepeat, 0 release
        if (ev.type == EV_KEY && ev.code == keycode_) {
            sink_(levels_.update(device.fd, ev.value != 0));
        }
    }
}

} // namespace

std::unique_ptr<HotkeyBackend> make_evdev_backend() {
    return std::make_unique<EvdevHotkeyBackend>();
}

} // namespace voxkey
