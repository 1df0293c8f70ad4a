#include "hotkey/held_keys.hpp"

#include <algorithm>

void HeldKeys::update(int device, const KeyEvent& event) {
    if (event.pressed) {
        down_[device].insert(event.code);
        return;
    }
    auto it = down_.find(device);
    if (it == down_.end()) return;
    it->second.erase(event.code);
    if (it->second.empty()) down_.erase(it);
}

std::vector<KeyEvent> HeldKeys::release_device(int device,
                                               std::chrono::steady_clock::time_point now) {
    std::vector<KeyEvent> releases;
    auto it = down_.find(device);
    if (it == down_.end()) return releases;

    auto keys = std::move(it->second);
    down_.erase(it);

    for (KeyCode code : keys) {
        bool elsewhere = std::ranges::any_of(down_, [code](const auto& entry) {
            return entry.second.contains(code);
        });
        if (!elsewhere) releases.push_back(KeyEvent{code, false, now});
    }
    return releases;
}
