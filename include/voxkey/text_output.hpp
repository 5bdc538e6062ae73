#pragma once

#include "voxkey/task_executor.hpp"

#include <string>

namespace voxkey {

// Delivers recognized text to the focused application. Work is queued on a
// dedicated thread so callers never wait on the clipboard or the X server.
class TextOutput {
public:
    TextOutput(bool auto_paste, bool add_space_between_utterances);
    ~TextOutput();

    // Queue text for delivery. Returns false if the output is shut down.
    bool type_text(const std::string& text);

    // Text as it will be delivered, given how many utterances came before
    static std::string format_utterance(const std::string& text, bool add_space, bool first);

    void shutdown();

private:
    void deliver(const std::string& text);

    bool auto_paste_;
    bool add_space_;
    bool first_utterance_ = true;     // output thread only
    int consecutive_failures_ = 0;    // output thread only
    TaskExecutor worker_;
};

} // namespace voxkey
