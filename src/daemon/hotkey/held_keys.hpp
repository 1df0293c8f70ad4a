#pragma once

#include "platform/key_source.hpp"

#include <chrono>
#include <map>
#include <set>
#include <vector>

// Keys each input device is holding down, so a device that disappears
// mid-press can still release them.
class HeldKeys {
public:
    void update(int device, const KeyEvent& event);

    // Key-up events for everything `device` held that no other device still
    // holds. Forgets the device.
    std::vector<KeyEvent> release_device(int device, std::chrono::steady_clock::time_point now);

private:
    std::map<int, std::set<KeyCode>> down_;
};
