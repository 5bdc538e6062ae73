#include "voxkey/text_output.hpp"
#include "voxkey/clipboard.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace voxkey {

// Warn once failures pile up, typically a missing xclip or a lost display
static constexpr int MAX_CONSECUTIVE_FAILURES = 5;

TextOutput::TextOutput(bool auto_paste, bool add_space_between_utterances)
    : auto_paste_(auto_paste)
    , add_space_(add_space_between_utterances) {
}

TextOutput::~TextOutput() {
    shutdown();
}

void TextOutput::shutdown() {
    worker_.shutdown();
}

std::string TextOutput::format_utterance(const std::string& text, bool add_space, bool first) {
    if (add_space && !first && !text.empty()) {
        return " " + text;
    }
    return text;
}

bool TextOutput::type_text(const std::string& text) {
    if (text.empty()) return true;
    return worker_.post([this, text]() {
        deliver(text);
    });
}

void TextOutput::deliver(const std::string& text) {
    std::string output = format_utterance(text, add_space_, first_utterance_);
    first_utterance_ = false;

    bool ok = Clipboard::set_text(output);
    if (ok && auto_paste_) {
        // Delay to ensure clipboard is fully set before pasting
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ok = Clipboard::paste();
    }

    if (ok) {
        consecutive_failures_ = 0;
        return;
    }

    ++consecutive_failures_;
    std::cerr << "Failed to deliver text (" << consecutive_failures_ << " in a row)" << std::endl;
    if (consecutive_failures_ == MAX_CONSECUTIVE_FAILURES) {
        std::cerr << "Text output keeps failing. Check that xclip or xsel is installed and DISPLAY is set." << std::endl;
    }
}

} // namespace voxkey
