#include "platform/linux/linux_event_loop.hpp"

#include "hotkey/hotkey_monitor.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      audio_source_(std::chrono::milliseconds(config_.audio.stall_timeout_ms)),
      connector_(WebSocketOptions{
          .connect_timeout = std::chrono::seconds(config_.backend.connect_timeout_s),
          .send_wav_header = config_.backend.send_wav_header,
          .sample_rate = config_.audio.sample_rate,
          .channels = static_cast<uint16_t>(config_.audio.channels),
      }),
      core_(config_, verbose_, audio_source_, connector_, injector_) {}

LinuxEventLoop::~LinuxEventLoop() {
    keyboard_.interrupt();
    if (hotkey_thread_.joinable()) hotkey_thread_.join();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    // Keyboard access is required; without it there is no way to dictate
    if (auto res = keyboard_.open(); !res) {
        std::println(stderr, "Cannot attach to keyboard input: {}", res.error().message);
        return false;
    }
    log(std::format("Watching {} keyboard device(s)", keyboard_.device_count()));

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    return core_.init();
}

bool LinuxEventLoop::start() {
    // Block the signals before any thread starts so only signalfd sees them
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    core_.start();
    hotkey_thread_ = std::jthread([this] { watch_hotkey(); });

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::watch_hotkey() {
    HotkeyMonitor monitor(keyboard_, core_.hotkey(),
                          std::chrono::duration<double>(config_.hotkey.cooldown_s));
    while (monitor.next()) {
        core_.toggle("hotkey");
    }
    log("Hotkey monitor stopped");
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    log("Press " + format_combo(core_.hotkey()) + " to start/stop dictation");

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            serve_client(fd);
        }
    }

    // Clean shutdown
    keyboard_.interrupt();
    if (hotkey_thread_.joinable()) hotkey_thread_.join();
    core_.shutdown();
}

void LinuxEventLoop::serve_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcRead::Command: {
                std::string cmd_str = cmd.value("cmd", "");
                ipc_server_.send_response(fd, core_.handle_command(cmd_str, cmd));
                break;
            }
            case IpcRead::Invalid:
                ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid command"}});
                break;
            case IpcRead::Pending:
                return;
            case IpcRead::Closed:
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[keyscribe] {}", msg);
    }
}
