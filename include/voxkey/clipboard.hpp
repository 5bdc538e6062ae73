#pragma once

#include <string>

namespace voxkey {

class Clipboard {
public:
    // Set text to clipboard
    static bool set_text(const std::string& text);

    // Paste clipboard content into the focused window (simulates Ctrl+V)
    static bool paste();
};

} // namespace voxkey
