#include "hotkey/hotkey_monitor.hpp"

HotkeyMatcher::HotkeyMatcher(HotkeyCombo combo, std::chrono::duration<double> cooldown)
    : combo_(std::move(combo)), cooldown_(cooldown) {}

std::optional<ToggleEvent> HotkeyMatcher::on_key(const KeyEvent& event) {
    if (!event.pressed) {
        held_.erase(event.code);
        return std::nullopt;
    }

    held_.insert(event.code);
    if (held_ != combo_) return std::nullopt;

    if (last_toggle_ && event.time - *last_toggle_ < cooldown_) {
        return std::nullopt;
    }

    last_toggle_ = event.time;
    return ToggleEvent{event.time};
}

HotkeyMonitor::HotkeyMonitor(KeyEventSource& source, HotkeyCombo combo,
                             std::chrono::duration<double> cooldown)
    : source_(source), matcher_(std::move(combo), cooldown) {}

std::optional<ToggleEvent> HotkeyMonitor::next() {
    while (auto event = source_.next()) {
        if (auto toggle = matcher_.on_key(*event)) {
            return toggle;
        }
    }
    return std::nullopt;
}
