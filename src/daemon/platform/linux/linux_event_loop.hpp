#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/evdev_keyboard.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wtype_injector.hpp"
#include "transcription/websocket_channel.hpp"

#include <atomic>
#include <thread>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Opens the keyboards and the control socket and validates the hotkey.
    // Starts no thread, so the descriptors survive a later daemonize().
    bool init();

    // Installs the signal handling and starts the hotkey and controller
    // threads.
    bool start();

    void run();

private:
    void watch_hotkey();
    void serve_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PipeWireSource audio_source_;
    WebSocketConnector connector_;
    WtypeInjector injector_;
    EvdevKeyboard keyboard_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    std::jthread hotkey_thread_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
