#include "voxkey/hotkey_backend.hpp"
#include "voxkey/edge_detector.hpp"
#include <iostream>
#include <cstring>
#include <atomic>
#include <chrono>
#include <thread>
#include <poll.h>

#include <X11/Xlib.h>
#include <X11/extensions/record.h>

namespace voxkey {

namespace {

// X keycodes are evdev codes shifted by the minimum keycode the server reserves
constexpr uint32_t X_KEYCODE_OFFSET = 8;

class X11HotkeyBackend : public HotkeyBackend {
public:
    ~X11HotkeyBackend() override { stop(); }

    const char* name() const override { return "x11"; }

    bool try_start(uint32_t keycode, LevelSink sink) override;
    void stop() override;

private:
    static void record_callback(XPointer closure, XRecordInterceptData* data);

    void run_loop();
    bool key_down_in_keymap();
    void poll_keymap();
    void close_displays();

    // control_ issues requests and answers XQueryKeymap; data_ carries the
    // recorded event stream
    Display* control_ = nullptr;
    Display* data_ = nullptr;
    XRecordContext context_ = 0;

    unsigned int x_keycode_ = 0;
    LevelSink sink_;
    RepeatFilter repeat_filter_;   // listener thread only
    std::atomic<bool> running_{false};
    std::thread listener_thread_;
};

bool X11HotkeyBackend::try_start(uint32_t keycode, LevelSink sink) {
    if (running_.load()) return true;

    x_keycode_ = keycode + X_KEYCODE_OFFSET;
    if (x_keycode_ > 255) {
        std::cerr << "Key " << keycode << " has no X11 keycode" << std::endl;
        return false;
    }
    sink_ = std::move(sink);
    repeat_filter_ = RepeatFilter();

    control_ = XOpenDisplay(nullptr);
    data_ = XOpenDisplay(nullptr);
    if (!control_ || !data_) {
        std::cerr << "Failed to open X display" << std::endl;
        close_displays();
        return false;
    }

    int major = 0, minor = 0;
    if (!XRecordQueryVersion(control_, &major, &minor)) {
        std::cerr << "X server lacks the RECORD extension" << std::endl;
        close_displays();
        return false;
    }

    XRecordRange* range = XRecordAllocRange();
    if (!range) {
        close_displays();
        return false;
    }
    range->device_events.first = KeyPress;
    range->device_events.last = KeyRelease;

    XRecordClientSpec clients = XRecordAllClients;
    context_ = XRecordCreateContext(control_, 0, &clients, 1, &range, 1);
    XFree(range);
    if (!context_) {
        std::cerr << "Failed to create XRecord context" << std::endl;
        close_displays();
        return false;
    }
    XSync(control_, False);

    if (!XRecordEnableContextAsync(data_, context_, record_callback, reinterpret_cast<XPointer>(this))) {
        std::cerr << "Failed to enable XRecord context" << std::endl;
        close_displays();
        return false;
    }

    std::cout << "Using X11 record extension " << major << "." << minor << std::endl;

    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void X11HotkeyBackend::stop() {
    if (running_.exchange(false) && listener_thread_.joinable()) {
        listener_thread_.join();
    }
    close_displays();
}

void X11HotkeyBackend::close_displays() {
    if (control_ && context_) {
        XRecordDisableContext(control_, context_);
        XSync(control_, False);
        XRecordFreeContext(control_, context_);
        context_ = 0;
    }
    if (data_) {
        XCloseDisplay(data_);
        data_ = nullptr;
    }
    if (control_) {
        XCloseDisplay(control_);
        control_ = nullptr;
    }
}

void X11HotkeyBackend::record_callback(XPointer closure, XRecordInterceptData* data) {
    auto* self = reinterpret_cast<X11HotkeyBackend*>(closure);

    // data_len counts 4-byte units; key events are 32 bytes
    if (data->category == XRecordFromServer && data->data && data->data_len >= 2) {
        int type = data->data[0] & 0x7F;
        unsigned int detail = data->data[1];
        if (detail == self->x_keycode_ && (type == KeyPress || type == KeyRelease)) {
            // Event time, bytes 4-7 of the wire event; only compared for equality
            uint32_t time = 0;
            std::memcpy(&time, data->data + 4, sizeof(time));
            for (bool down : self->repeat_filter_.push(type == KeyPress, time)) {
                self->sink_(down);
            }
        }
    }

    XRecordFreeData(data);
}

bool X11HotkeyBackend::key_down_in_keymap() {
    char keys[32];
    XQueryKeymap(control_, keys);
    return (keys[x_keycode_ / 8] & (1 << (x_keycode_ % 8))) != 0;
}

void X11HotkeyBackend::poll_keymap() {
    sink_(key_down_in_keymap());
}

void X11HotkeyBackend::run_loop() {
    const auto keymap_interval = std::chrono::milliseconds(50);
    auto next_keymap_poll = std::chrono::steady_clock::now();

    struct pollfd pfd;
    pfd.fd = ConnectionNumber(data_);
    pfd.events = POLLIN;

    while (running_.load()) {
        pfd.revents = 0;
        poll(&pfd, 1, 20);

        // Global observer: everything recorded since the last pass
        XRecordProcessReplies(data_);

        // A release with no matching repeat press: forward it only if the
        // key is really up
        if (repeat_filter_.take_pending() && !key_down_in_keymap()) {
            sink_(false);
        }

        // Local observer: the keymap as seen by this connection
        auto now = std::chrono::steady_clock::now();
        if (now >= next_keymap_poll) {
            poll_keymap();
            next_keymap_poll = now + keymap_interval;
        }
    }
}

} // namespace

std::unique_ptr<HotkeyBackend> make_x11_backend() {
    return std::make_unique<X11HotkeyBackend>();
}

} // namespace voxkey
