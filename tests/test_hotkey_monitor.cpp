#include <catch2/catch_test_macros.hpp>

#include "hotkey/held_keys.hpp"
#include "hotkey/hotkey_monitor.hpp"
#include "mocks.hpp"

#include <chrono>
#include <linux/input-event-codes.h>

using namespace std::chrono_literals;

namespace {

const HotkeyCombo kCombo{KEY_LEFTCTRL, KEY_LEFTALT, KEY_R};

struct Keys {
    std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();

    KeyEvent down(KeyCode code, std::chrono::milliseconds at) { return {code, true, t0 + at}; }
    KeyEvent up(KeyCode code, std::chrono::milliseconds at) { return {code, false, t0 + at}; }
};

} // namespace

TEST_CASE("HotkeyMatcher", "[hotkey]") {
    Keys k;
    HotkeyMatcher m(kCombo, 500ms);

    SECTION("FiresWhenLastComboKeyGoesDown") {
        REQUIRE_FALSE(m.on_key(k.down(KEY_LEFTCTRL, 0ms)));
        REQUIRE_FALSE(m.on_key(k.down(KEY_LEFTALT, 10ms)));
        auto t = m.on_key(k.down(KEY_R, 20ms));
        REQUIRE(t.has_value());
        REQUIRE(t->time == k.t0 + 20ms);
    }

    SECTION("PressOrderDoesNotMatter") {
        REQUIRE_FALSE(m.on_key(k.down(KEY_R, 0ms)));
        REQUIRE_FALSE(m.on_key(k.down(KEY_LEFTALT, 10ms)));
        REQUIRE(m.on_key(k.down(KEY_LEFTCTRL, 20ms)));
    }

    SECTION("SupersetDoesNotFire") {
        m.on_key(k.down(KEY_LEFTSHIFT, 0ms));
        m.on_key(k.down(KEY_LEFTCTRL, 10ms));
        m.on_key(k.down(KEY_LEFTALT, 20ms));
        REQUIRE_FALSE(m.on_key(k.down(KEY_R, 30ms)));
    }

    SECTION("KeyUpNeverFires") {
        m.on_key(k.down(KEY_LEFTCTRL, 0ms));
        m.on_key(k.down(KEY_LEFTALT, 10ms));
        m.on_key(k.down(KEY_R, 20ms));
        m.on_key(k.down(KEY_LEFTSHIFT, 30ms));
        // Releasing shift makes the held set equal the combo again
        REQUIRE_FALSE(m.on_key(k.up(KEY_LEFTSHIFT, 2000ms)));
        REQUIRE(m.held() == kCombo);
    }

    SECTION("CooldownSuppressesRapidRepeat") {
        m.on_key(k.down(KEY_LEFTCTRL, 0ms));
        m.on_key(k.down(KEY_LEFTALT, 0ms));
        REQUIRE(m.on_key(k.down(KEY_R, 0ms)));

        m.on_key(k.up(KEY_R, 100ms));
        REQUIRE_FALSE(m.on_key(k.down(KEY_R, 200ms)));

        m.on_key(k.up(KEY_R, 300ms));
        REQUIRE(m.on_key(k.down(KEY_R, 600ms)));
    }

    SECTION("ReleaseClearsHeldSet") {
        m.on_key(k.down(KEY_LEFTCTRL, 0ms));
        m.on_key(k.up(KEY_LEFTCTRL, 10ms));
        m.on_key(k.up(KEY_Q, 20ms));
        REQUIRE(m.held().empty());
    }

    SECTION("SingleKeyCombo") {
        HotkeyMatcher single({KEY_F9}, 0ms);
        REQUIRE(single.on_key(k.down(KEY_F9, 0ms)));
        single.on_key(k.up(KEY_F9, 1ms));
        REQUIRE(single.on_key(k.down(KEY_F9, 2ms)));
    }
}

TEST_CASE("HotkeyMonitor", "[hotkey]") {
    Keys k;

    SECTION("YieldsOneToggleForEachChord") {
        ScriptedKeySource src({
            k.down(KEY_LEFTCTRL, 0ms), k.down(KEY_LEFTALT, 5ms), k.down(KEY_R, 10ms),
            k.up(KEY_R, 50ms), k.up(KEY_LEFTALT, 55ms), k.up(KEY_LEFTCTRL, 60ms),
            k.down(KEY_A, 100ms), k.up(KEY_A, 120ms),
            k.down(KEY_LEFTCTRL, 1000ms), k.down(KEY_LEFTALT, 1005ms), k.down(KEY_R, 1010ms),
        });
        HotkeyMonitor mon(src, kCombo, 500ms);

        auto first = mon.next();
        REQUIRE(first.has_value());
        REQUIRE(first->time == k.t0 + 10ms);

        auto second = mon.next();
        REQUIRE(second.has_value());
        REQUIRE(second->time == k.t0 + 1010ms);

        REQUIRE_FALSE(mon.next().has_value());
    }

    SECTION("EndsWhenSourceCloses") {
        ScriptedKeySource src({k.down(KEY_LEFTCTRL, 0ms)});
        HotkeyMonitor mon(src, kCombo, 500ms);
        REQUIRE_FALSE(mon.next().has_value());
    }
}

TEST_CASE("HeldKeys", "[hotkey]") {
    Keys k;
    HeldKeys held;

    SECTION("LostDeviceReleasesItsKeys") {
        held.update(3, k.down(KEY_LEFTCTRL, 0ms));
        held.update(3, k.down(KEY_LEFTALT, 5ms));
        held.update(3, k.down(KEY_A, 10ms));
        held.update(3, k.up(KEY_A, 20ms));

        auto released = held.release_device(3, k.t0 + 30ms);
        REQUIRE(released.size() == 2);
        for (auto& ev : released) {
            REQUIRE_FALSE(ev.pressed);
            REQUIRE(ev.time == k.t0 + 30ms);
        }

        // Forgotten after the first release
        REQUIRE(held.release_device(3, k.t0 + 40ms).empty());
    }

    SECTION("KeyStillHeldElsewhereIsKept") {
        held.update(3, k.down(KEY_LEFTCTRL, 0ms));
        held.update(4, k.down(KEY_LEFTCTRL, 5ms));
        held.update(3, k.down(KEY_R, 10ms));

        auto released = held.release_device(3, k.t0 + 20ms);
        REQUIRE(released.size() == 1);
        REQUIRE(released[0].code == KEY_R);
    }

    SECTION("UnknownDeviceReleasesNothing") {
        REQUIRE(held.release_device(9, k.t0).empty());
    }

    SECTION("ComboFiresAgainAfterKeyboardUnplugged") {
        HotkeyMatcher m(kCombo, 0ms);
        for (auto ev : {k.down(KEY_LEFTCTRL, 0ms), k.down(KEY_LEFTALT, 5ms)}) {
            held.update(3, ev);
            m.on_key(ev);
        }

        // Keyboard 3 vanishes with both modifiers down
        for (auto& ev : held.release_device(3, k.t0 + 50ms)) m.on_key(ev);
        REQUIRE(m.held().empty());

        REQUIRE_FALSE(m.on_key(k.down(KEY_LEFTCTRL, 100ms)));
        REQUIRE_FALSE(m.on_key(k.down(KEY_LEFTALT, 105ms)));
        REQUIRE(m.on_key(k.down(KEY_R, 110ms)));
    }
}
