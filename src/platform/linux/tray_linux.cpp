#include "voxkey/app.hpp"
#include <iostream>
#include <deque>
#include <mutex>

// Linux status output - console only, no tray toolkit dependency

namespace voxkey {

static constexpr size_t MAX_HISTORY = 10;

static std::mutex g_history_mutex;
static std::deque<std::string> g_history;

void update_tray_state(TrayState state) {
    const char* state_str = "";
    switch (state) {
        case TrayState::Idle:
            state_str = "Ready";
            break;
        case TrayState::Recording:
            state_str = "Recording...";
            break;
        case TrayState::Transcribing:
            state_str = "Transcribing...";
            break;
        case TrayState::Error:
            state_str = "Error";
            break;
    }
    std::cout << "[voxkey] " << state_str << std::endl;
}

void add_to_history(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_history_mutex);
    g_history.push_front(text);
    if (g_history.size() > MAX_HISTORY) {
        g_history.pop_back();
    }
    std::cout << "[voxkey] #" << g_history.size() << ": " << text << std::endl;
}

} // namespace voxkey
