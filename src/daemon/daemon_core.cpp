#include "daemon_core.hpp"

#include <chrono>
#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioSource& audio, ChannelConnector& connector, KeyInjector& injector)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio), connector_(connector), injector_(injector) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    auto combo = parse_combo(config_.hotkey.keys);
    if (!combo) {
        std::println(stderr, "Invalid hotkey: {}", combo.error());
        return false;
    }
    combo_ = std::move(*combo);

    auto reduction = parse_reduction(config_.session.reduction);
    if (!reduction) {
        std::println(stderr, "Unknown reduction policy: {}", config_.session.reduction);
        return false;
    }

    output_ = std::make_unique<TypeOutput>(
        injector_, std::chrono::duration<double>(config_.output.typing_delay_s));

    SessionOptions opts{
        .endpoint = config_.backend.url,
        .audio = AudioFormat{
            .sample_rate = config_.audio.sample_rate,
            .channels = config_.audio.channels,
            .frame_ms = config_.audio.frame_ms,
        },
        .max_wait = std::chrono::milliseconds(
            static_cast<int64_t>(config_.session.max_wait_s * 1000.0)),
        .reduction = *reduction,
    };

    controller_ = std::make_unique<SessionController>(
        std::move(opts), audio_, connector_, *output_, verbose_);
    controller_->set_completion_callback([this](const SessionReport& r) {
        if (r.abort_reason) {
            log(std::format("Session {} ended early ({}): {}", r.id,
                            to_string(r.abort_reason->kind), r.abort_reason->message));
        }
        if (r.text.empty()) {
            log("Nothing transcribed, no output");
        } else {
            log(std::format("Typed {} chars in {:.1f}s session", r.text.size(), r.duration_s));
        }
    });
    return true;
}

void DaemonCore::start() {
    if (controller_) controller_->start();
}

ToggleAction DaemonCore::toggle(const std::string& source) {
    if (!controller_) return ToggleAction::Ignore;
    auto action = controller_->toggle();
    log(std::format("Toggle from {}: {}", source, to_string(action)));
    return action;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& /*cmd*/) {
    if (!controller_) {
        return {{"status", "error"}, {"message", "not initialized"}};
    }
    auto before = controller_->state();
    // The controller applies the toggle asynchronously; report what it will do.
    auto action = toggle("ipc");
    return {{"status", "ok"}, {"state", to_string(before)}, {"action", to_string(action)}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"state", to_string(session_state())}};

    if (controller_) {
        if (auto r = controller_->last_report()) {
            nlohmann::json last = {
                {"id", r->id},
                {"text", r->text},
                {"frames_sent", r->frames_sent},
                {"finals", r->finals},
                {"partials", r->partials},
                {"deadline_expired", r->deadline_expired},
                {"duration", r->duration_s},
            };
            if (r->abort_reason) {
                last["error"] = std::string(to_string(r->abort_reason->kind)) + ": " +
                                r->abort_reason->message;
            }
            resp["last_session"] = std::move(last);
        }
    }
    return resp;
}

SessionState DaemonCore::session_state() const {
    return controller_ ? controller_->state() : SessionState::Idle;
}

void DaemonCore::shutdown() {
    if (controller_) {
        if (controller_->state() != SessionState::Idle) {
            log("Stopping session in flight...");
        }
        controller_->shutdown();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[keyscribe] {}", msg);
    }
}
