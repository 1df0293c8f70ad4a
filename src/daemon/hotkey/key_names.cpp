#include "hotkey/key_names.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <linux/input-event-codes.h>

namespace {

struct NamedKey {
    std::string_view name;
    KeyCode code;
};

constexpr NamedKey kKeys[] = {
    {"ctrl_l", KEY_LEFTCTRL},   {"ctrl_r", KEY_RIGHTCTRL},
    {"alt_l", KEY_LEFTALT},     {"alt_r", KEY_RIGHTALT},
    {"shift_l", KEY_LEFTSHIFT}, {"shift_r", KEY_RIGHTSHIFT},
    {"super_l", KEY_LEFTMETA},  {"super_r", KEY_RIGHTMETA},
    {"space", KEY_SPACE},       {"enter", KEY_ENTER},
    {"tab", KEY_TAB},           {"esc", KEY_ESC},
    {"pause", KEY_PAUSE},       {"scroll_lock", KEY_SCROLLLOCK},
    {"insert", KEY_INSERT},     {"menu", KEY_COMPOSE},
    {"f1", KEY_F1},   {"f2", KEY_F2},   {"f3", KEY_F3},   {"f4", KEY_F4},
    {"f5", KEY_F5},   {"f6", KEY_F6},   {"f7", KEY_F7},   {"f8", KEY_F8},
    {"f9", KEY_F9},   {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
    {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
    {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
    {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
    {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
    {"z", KEY_Z},
    {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
    {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
    {"period", KEY_DOT}, {"comma", KEY_COMMA}, {"slash", KEY_SLASH},
    {"semicolon", KEY_SEMICOLON}, {"grave", KEY_GRAVE},
};

} // namespace

std::optional<KeyCode> key_from_name(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Aliases without a side default to the left key
    if (lower == "ctrl") lower = "ctrl_l";
    else if (lower == "alt") lower = "alt_l";
    else if (lower == "shift") lower = "shift_l";
    else if (lower == "super") lower = "super_l";

    auto it = std::ranges::find_if(kKeys, [&lower](const NamedKey& k) { return k.name == lower; });
    if (it == std::end(kKeys)) return std::nullopt;
    return it->code;
}

std::string key_name(KeyCode code) {
    auto it = std::ranges::find_if(kKeys, [code](const NamedKey& k) { return k.code == code; });
    if (it == std::end(kKeys)) return "key" + std::to_string(code);
    return std::string(it->name);
}

std::expected<HotkeyCombo, std::string> parse_combo(const std::vector<std::string>& names) {
    if (names.empty()) {
        return std::unexpected("hotkey combination is empty");
    }

    HotkeyCombo combo;
    for (auto& n : names) {
        auto code = key_from_name(n);
        if (!code) {
            return std::unexpected("unknown key name '" + n + "'");
        }
        combo.insert(*code);
    }
    return combo;
}

std::string format_combo(const HotkeyCombo& combo) {
    std::string out;
    for (KeyCode code : combo) {
        auto name = key_name(code);
        if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
        if (!out.empty()) out += '+';
        out += name;
    }
    return out;
}
