#pragma once

#include "hotkey/key_names.hpp"
#include "platform/key_source.hpp"

#include <chrono>
#include <optional>
#include <set>

struct ToggleEvent {
    std::chrono::steady_clock::time_point time;
};

// Edge-triggered combo detection with a cooldown between toggles.
class HotkeyMatcher {
public:
    HotkeyMatcher(HotkeyCombo combo, std::chrono::duration<double> cooldown);

    // Updates the held set. Returns a toggle when this key-down makes the
    // held set exactly equal to the combo and the cooldown has elapsed.
    std::optional<ToggleEvent> on_key(const KeyEvent& event);

    const std::set<KeyCode>& held() const { return held_; }

private:
    HotkeyCombo combo_;
    std::chrono::duration<double> cooldown_;
    std::set<KeyCode> held_;
    std::optional<std::chrono::steady_clock::time_point> last_toggle_;
};

// Lazy sequence of toggles pulled from a key event source.
class HotkeyMonitor {
public:
    HotkeyMonitor(KeyEventSource& source, HotkeyCombo combo,
                  std::chrono::duration<double> cooldown);

    // Blocks until the next toggle. std::nullopt once the source is closed.
    std::optional<ToggleEvent> next();

private:
    KeyEventSource& source_;
    HotkeyMatcher matcher_;
};
