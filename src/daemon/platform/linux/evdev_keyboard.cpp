#include "platform/linux/evdev_keyboard.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <linux/input.h>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool test_bit(const unsigned long* bits, int bit) {
    constexpr int kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

// Anything that reports letter keys and Enter counts as a keyboard.
bool is_keyboard(int fd) {
    constexpr int kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;
    unsigned long key_bits[(KEY_MAX + kBitsPerLong) / kBitsPerLong] = {};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) return false;
    return test_bit(key_bits, KEY_A) && test_bit(key_bits, KEY_Z) && test_bit(key_bits, KEY_ENTER);
}

} // namespace

EvdevKeyboard::EvdevKeyboard() = default;

EvdevKeyboard::~EvdevKeyboard() {
    for (auto& d : devices_) ::close(d.fd);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

std::expected<void, Error> EvdevKeyboard::open(const std::string& dir) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return std::unexpected(Error{ErrorKind::Input,
            std::string("epoll_create1 failed: ") + std::strerror(errno)});
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        return std::unexpected(Error{ErrorKind::Input,
            std::string("eventfd failed: ") + std::strerror(errno)});
    }
    epoll_event wake_ev{.events = EPOLLIN, .data = {.fd = wake_fd_}};
    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &wake_ev);

    std::error_code ec;
    size_t denied = 0;
    for (auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (!name.starts_with("event")) continue;

        int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) denied++;
            continue;
        }

        if (!is_keyboard(fd)) {
            ::close(fd);
            continue;
        }

        int clock = CLOCK_MONOTONIC;
        bool monotonic = ::ioctl(fd, EVIOCSCLOCKID, &clock) == 0;

        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            ::close(fd);
            continue;
        }
        devices_.push_back({fd, entry.path().string(), monotonic});
    }

    if (ec) {
        return std::unexpected(Error{ErrorKind::Input,
            "cannot list " + dir + ": " + ec.message()});
    }

    if (devices_.empty()) {
        std::string msg = "no readable keyboard device in " + dir;
        if (denied > 0) msg += " (permission denied; add the user to the 'input' group)";
        return std::unexpected(Error{ErrorKind::Input, msg});
    }

    return {};
}

std::optional<KeyEvent> EvdevKeyboard::next() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (pending_.empty()) {
        if (devices_.empty()) return std::nullopt;

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "hotkey: epoll_wait error: {}", std::strerror(errno));
            return std::nullopt;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) return std::nullopt;

            auto it = std::ranges::find_if(devices_, [fd](const Device& d) { return d.fd == fd; });
            if (it == devices_.end()) continue;
            if (!read_device(*it)) remove_device(fd);
        }
    }

    auto ev = pending_.front();
    pending_.pop_front();
    return ev;
}

bool EvdevKeyboard::read_device(Device& dev) {
    input_event buf[64];
    while (true) {
        ssize_t n = ::read(dev.fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            if (errno == EINTR) continue;
            std::println(stderr, "hotkey: lost {}: {}", dev.path, std::strerror(errno));
            return false;
        }
        if (n == 0) return false;

        size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; i++) {
            auto& ie = buf[i];
            // value: 0 release, 1 press, 2 auto-repeat
            if (ie.type != EV_KEY || ie.value == 2) continue;

            KeyEvent ev;
            ev.code = static_cast<KeyCode>(ie.code);
            ev.pressed = ie.value == 1;
            if (dev.monotonic) {
                ev.time = std::chrono::steady_clock::time_point(
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::seconds(ie.input_event_sec) +
                        std::chrono::microseconds(ie.input_event_usec)));
            } else {
                ev.time = std::chrono::steady_clock::now();
            }
            held_.update(dev.fd, ev);
            pending_.push_back(ev);
        }
    }
}

void EvdevKeyboard::remove_device(int fd) {
    for (auto& ev : held_.release_device(fd, std::chrono::steady_clock::now())) {
        pending_.push_back(ev);
    }
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    std::erase_if(devices_, [fd](const Device& d) { return d.fd == fd; });
}

void EvdevKeyboard::interrupt() {
    if (wake_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "hotkey: wakeup write failed: {}", std::strerror(errno));
    }
}
