#include "voxkey/ffi.hpp"
#include "voxkey/config.hpp"
#include "voxkey/event_channel.hpp"
#include "voxkey/hotkey_manager.hpp"
#include <iostream>
#include <atomic>
#include <mutex>
#include <thread>

namespace voxkey {

namespace {

// Edges travel from the backend's input thread to one dispatch thread, so
// the host callback never runs on the input thread and never runs twice
// at once.
struct KeyboardMonitor {
    std::unique_ptr<HotkeyManager> manager;
    std::shared_ptr<EventChannel<bool>> edges;
    std::thread dispatcher;
};

std::mutex g_monitor_mutex;
HotkeyBackendFactory g_backend_factory;
std::unique_ptr<KeyboardMonitor> g_monitor;
std::atomic<voxkey_push_to_talk_callback> g_callback{nullptr};

void dispatch_loop(std::shared_ptr<EventChannel<bool>> edges) {
    while (auto pressed = edges->pop()) {
        voxkey_push_to_talk_callback callback = g_callback.load();
        if (callback) callback(*pressed);
    }
}

void close_monitor(KeyboardMonitor& monitor) {
    // stop() may post a final release; it is delivered before the loop ends
    monitor.manager->stop();
    monitor.edges->close();
    if (!monitor.dispatcher.joinable()) return;
    if (monitor.dispatcher.get_id() == std::this_thread::get_id()) {
        // Shut down from inside the host callback: the loop drains the
        // closed channel and exits on its own
        monitor.dispatcher.detach();
    } else {
        monitor.dispatcher.join();
    }
}

} // namespace

void set_hotkey_backend_factory(HotkeyBackendFactory factory) {
    std::lock_guard<std::mutex> lock(g_monitor_mutex);
    g_backend_factory = std::move(factory);
}

} // namespace voxkey

using namespace voxkey;

extern "C" bool voxkey_init_keyboard_monitor(void) {
    std::lock_guard<std::mutex> lock(g_monitor_mutex);
    if (g_monitor) return true;

    Config config;
    load_config_file(default_config_path(), config);

    auto backends = g_backend_factory ? g_backend_factory()
                                      : HotkeyManager::backends_for(config.hotkey_backend);

    auto monitor = std::make_unique<KeyboardMonitor>();
    monitor->manager = std::make_unique<HotkeyManager>(std::move(backends));
    monitor->edges = std::make_shared<EventChannel<bool>>();
    monitor->manager->set_hotkey(config.hotkey_keycode);

    std::shared_ptr<EventChannel<bool>> edges = monitor->edges;
    monitor->manager->set_callback([edges](bool pressed) {
        edges->push(pressed);
    });
    monitor->dispatcher = std::thread(dispatch_loop, edges);

    if (!monitor->manager->start()) {
        std::cerr << "voxkey_init_keyboard_monitor: no hotkey backend available";
        if (monitor->manager->permission_denied()) {
            std::cerr << " (permission denied for /dev/input)";
        }
        std::cerr << std::endl;
        close_monitor(*monitor);
        return false;
    }

    g_monitor = std::move(monitor);
    return true;
}

extern "C" void voxkey_shutdown_keyboard_monitor(void) {
    std::unique_ptr<KeyboardMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(g_monitor_mutex);
        monitor = std::move(g_monitor);
    }
    if (monitor) {
        close_monitor(*monitor);
    }
}

extern "C" void voxkey_register_push_to_talk_callback(voxkey_push_to_talk_callback callback) {
    g_callback.store(callback);
}
