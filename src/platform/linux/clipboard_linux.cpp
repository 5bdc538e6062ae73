#include "voxkey/clipboard.hpp"
#include <iostream>
#include <cstdio>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace voxkey {

namespace {

// Pipe text into a clipboard tool. Returns true if the tool exited cleanly.
bool pipe_to(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;
    size_t written = fwrite(text.c_str(), 1, text.length(), pipe);
    int ret = pclose(pipe);
    return ret == 0 && written == text.length();
}

void tap_key(Display* display, KeyCode keycode, bool press) {
    XTestFakeKeyEvent(display, keycode, press ? True : False, 0);
    XFlush(display);
}

} // namespace

bool Clipboard::set_text(const std::string& text) {
    if (pipe_to("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (pipe_to("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

bool Clipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    // Ctrl+V
    tap_key(display, ctrl_keycode, true);
    tap_key(display, v_keycode, true);
    tap_key(display, v_keycode, false);
    tap_key(display, ctrl_keycode, false);

    XCloseDisplay(display);
    return true;
}

} // namespace voxkey
