#pragma once

#include "hotkey/key_names.hpp"

#include <chrono>
#include <optional>

struct KeyEvent {
    KeyCode code = 0;
    bool pressed = false;
    std::chrono::steady_clock::time_point time;
};

// Global keyboard notifications, key-down and key-up only (no auto-repeat).
class KeyEventSource {
public:
    virtual ~KeyEventSource() = default;

    // Blocks for the next event. std::nullopt once interrupted or when no
    // device is left to read.
    virtual std::optional<KeyEvent> next() = 0;

    // Thread-safe. Wakes a blocked next().
    virtual void interrupt() = 0;
};
