#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace voxkey {

// One way of watching the push-to-talk key system-wide.
class HotkeyBackend {
public:
    // Raw key level, called on the backend's event thread for every event
    // concerning the hotkey, repeats included. Must return quickly.
    using LevelSink = std::function<void(bool key_down)>;

    virtual ~HotkeyBackend() = default;

    virtual const char* name() const = 0;

    // keycode is an evdev key code (linux/input-event-codes.h).
    // Returns false if the backend cannot run here.
    virtual bool try_start(uint32_t keycode, LevelSink sink) = 0;

    // Safe to call when not started
    virtual void stop() = 0;

    // True if the last try_start() failed for lack of permission
    virtual bool permission_denied() const { return false; }
};

// Reads /dev/input/event* through libevdev. Needs read access to the
// devices (usually membership in the "input" group).
std::unique_ptr<HotkeyBackend> make_evdev_backend();

// Observes the X server: an XRecord context for events delivered to every
// client, plus a poll of this connection's keymap.
std::unique_ptr<HotkeyBackend> make_x11_backend();

} // namespace voxkey
