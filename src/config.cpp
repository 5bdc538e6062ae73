#include "voxkey/config.hpp"
#include <iostream>
#include <fstream>
#include <algorithm>
#include <cstdlib>

namespace voxkey {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool parse_bool(const std::string& value, bool& out) {
    std::string v = lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool apply_key(Config& config, const std::string& key, const std::string& value) {
    if (key == "model_path") {
        config.model_path = value;
        return true;
    }
    if (key == "model_dir") {
        config.model_dir = value;
        return true;
    }
    if (key == "model_base_url") {
        config.model_base_url = value;
        return true;
    }
    if (key == "model_quality") {
        return parse_model_quality(value, config.model_quality);
    }
    if (key == "threads") {
        int threads = 0;
        if (!parse_int(value, threads) || threads <= 0) return false;
        config.n_threads = threads;
        return true;
    }
    if (key == "language") {
        if (value.empty()) return false;
        config.language = value;
        return true;
    }
    if (key == "hotkey_keycode") {
        int code = 0;
        if (!parse_int(value, code) || code <= 0) return false;
        config.hotkey_keycode = static_cast<uint32_t>(code);
        return true;
    }
    if (key == "hotkey_backend") {
        return parse_hotkey_backend(value, config.hotkey_backend);
    }
    if (key == "auto_paste") {
        return parse_bool(value, config.auto_paste);
    }
    if (key == "add_space_between_utterances") {
        return parse_bool(value, config.add_space_between_utterances);
    }
    if (key == "transcription_timeout_ms") {
        int timeout = 0;
        if (!parse_int(value, timeout) || timeout < 0) return false;
        config.transcription_timeout_ms = timeout;
        return true;
    }
    if (key == "use_gpu") {
        return parse_bool(value, config.use_gpu);
    }
    return false;
}

} // namespace

bool parse_model_quality(const std::string& name, ModelQuality& out) {
    std::string n = lower(name);
    if (n == "fast") out = ModelQuality::Fast;
    else if (n == "balanced") out = ModelQuality::Balanced;
    else if (n == "accurate") out = ModelQuality::Accurate;
    else if (n == "best") out = ModelQuality::Best;
    else return false;
    return true;
}

bool parse_hotkey_backend(const std::string& name, HotkeyBackendKind& out) {
    std::string n = lower(name);
    if (n == "auto") out = HotkeyBackendKind::Auto;
    else if (n == "evdev") out = HotkeyBackendKind::Evdev;
    else if (n == "x11") out = HotkeyBackendKind::X11;
    else return false;
    return true;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/voxkey/config";
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/voxkey/config";
}

bool load_config_file(const std::string& path, Config& config) {
    if (path.empty()) return false;

    std::ifstream file(path);
    if (!file.is_open()) {
        // No config file yet - defaults apply
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << path << ":" << line_no << ": expected key = value" << std::endl;
            continue;
        }

        std::string key = lower(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!apply_key(config, key, value)) {
            std::cerr << path << ":" << line_no << ": ignoring " << key << " = \"" << value << "\"" << std::endl;
        }
    }

    std::cout << "Loaded config: " << path << std::endl;
    return true;
}

void apply_environment(Config& config) {
    const char* dir = std::getenv("VOXKEY_MODEL_DIR");
    if (dir && *dir) {
        config.model_dir = dir;
    }
}

} // namespace voxkey
