#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

using KeyCode = uint16_t;
using HotkeyCombo = std::set<KeyCode>;

// Maps names like "ctrl_l", "alt_r", "r", "f12", "space" to evdev key codes.
std::optional<KeyCode> key_from_name(std::string_view name);

// Reverse lookup for log messages. Returns "key<code>" for unnamed codes.
std::string key_name(KeyCode code);

std::expected<HotkeyCombo, std::string> parse_combo(const std::vector<std::string>& names);

// "Ctrl_l+Alt_l+R" style, for the startup banner.
std::string format_combo(const HotkeyCombo& combo);
