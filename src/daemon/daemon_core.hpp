#pragma once

#include "config.hpp"
#include "hotkey/key_names.hpp"
#include "output/type_output.hpp"
#include "platform/audio_source.hpp"
#include "platform/key_injector.hpp"
#include "session.hpp"
#include "transcription/channel.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Portable daemon logic: turns configuration into a running session
// controller and answers control-socket commands.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose,
               AudioSource& audio, ChannelConnector& connector, KeyInjector& injector);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Validates the hotkey and reduction policy and builds the session
    // controller. Starts no thread, so it can run before daemonizing.
    bool init();

    // Starts the controller thread. Toggles sent before this wait for it.
    void start();

    // `source` is only used for logging ("hotkey", "ipc").
    ToggleAction toggle(const std::string& source);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    const HotkeyCombo& hotkey() const { return combo_; }
    SessionState session_state() const;

    void shutdown();

private:
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioSource& audio_;
    ChannelConnector& connector_;
    KeyInjector& injector_;

    HotkeyCombo combo_;
    std::unique_ptr<TypeOutput> output_;
    std::unique_ptr<SessionController> controller_;
};
