#pragma once

#include <cstdint>
#include <set>
#include <vector>

namespace voxkey {

enum class Edge {
    None,
    Pressed,
    Released
};

// Reduces a stream of key level samples to press/release transitions.
// Held keys repeat and some backends see the same event twice; only a
// change of level produces an edge.
class EdgeDetector {
public:
    Edge update(bool down) {
        if (down == pressed_) return Edge::None;
        pressed_ = down;
        return down ? Edge::Pressed : Edge::Released;
    }

    // Same, for a modifier mask and the bit that represents the hotkey
    Edge update_mask(uint32_t flags, uint32_t bit) {
        return update((flags & bit) != 0);
    }

    bool pressed() const { return pressed_; }
    void reset() { pressed_ = false; }

private:
    bool pressed_ = false;
};

// Hotkey level across several input devices: down while held on any of them.
// A device that goes away stops holding the key.
class DeviceLevels {
public:
    bool update(int device, bool down) {
        if (down) held_.insert(device);
        else held_.erase(device);
        return any_down();
    }

    bool remove(int device) {
        held_.erase(device);
        return any_down();
    }

    bool any_down() const { return !held_.empty(); }
    void clear() { held_.clear(); }

private:
    std::set<int> held_;
};

// X11 autorepeat arrives as a release immediately followed by a press with
// the same server timestamp. Releases are held back until the next event
// shows whether they were real.
class RepeatFilter {
public:
    // Levels to forward for one raw event
    std::vector<bool> push(bool down, uint32_t time) {
        std::vector<bool> out;
        if (down) {
            if (pending_release_ && time == pending_time_) {
                // Autorepeat pair: the key never went up
                pending_release_ = false;
                return out;
            }
            if (pending_release_) out.push_back(false);
            pending_release_ = false;
            out.push_back(true);
            return out;
        }

        if (pending_release_) out.push_back(false);
        pending_release_ = true;
        pending_time_ = time;
        return out;
    }

    // True if a release is still unresolved; clears it
    bool take_pending() {
        bool pending = pending_release_;
        pending_release_ = false;
        return pending;
    }

private:
    bool pending_release_ = false;
    uint32_t pending_time_ = 0;
};

} // namespace voxkey
