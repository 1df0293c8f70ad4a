#pragma once

#include "errors.hpp"
#include "hotkey/held_keys.hpp"
#include "platform/key_source.hpp"

#include <deque>
#include <expected>
#include <string>
#include <vector>

// Reads key events from every keyboard under /dev/input. Works under X11,
// Wayland and on the console, but needs read access to the event devices
// (usually membership in the "input" group).
class EvdevKeyboard : public KeyEventSource {
public:
    EvdevKeyboard();
    ~EvdevKeyboard() override;

    EvdevKeyboard(const EvdevKeyboard&) = delete;
    EvdevKeyboard& operator=(const EvdevKeyboard&) = delete;

    // Fails with ErrorKind::Input when no keyboard device can be opened.
    std::expected<void, Error> open(const std::string& dir = "/dev/input");

    // Keys held on a device that goes away are reported released.
    std::optional<KeyEvent> next() override;
    void interrupt() override;

    size_t device_count() const { return devices_.size(); }

private:
    struct Device {
        int fd;
        std::string path;
        bool monotonic; // kernel timestamps use CLOCK_MONOTONIC
    };

    bool read_device(Device& dev);
    void remove_device(int fd);

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::vector<Device> devices_;
    HeldKeys held_;
    std::deque<KeyEvent> pending_;
};
