#include "config.hpp"

#include "hotkey/key_names.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::expected<Config, std::string> Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("connect_timeout_s")) cfg.backend.connect_timeout_s = b["connect_timeout_s"].get<uint32_t>();
            if (b.contains("send_wav_header")) cfg.backend.send_wav_header = b["send_wav_header"].get<bool>();
        }

        if (j.contains("hotkey")) {
            auto& h = j["hotkey"];
            if (h.contains("keys")) cfg.hotkey.keys = h["keys"].get<std::vector<std::string>>();
            if (h.contains("cooldown_s")) cfg.hotkey.cooldown_s = h["cooldown_s"].get<double>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint32_t>();
            if (a.contains("frame_ms")) cfg.audio.frame_ms = a["frame_ms"].get<uint32_t>();
            if (a.contains("stall_timeout_ms")) cfg.audio.stall_timeout_ms = a["stall_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("max_wait_s")) cfg.session.max_wait_s = s["max_wait_s"].get<double>();
            if (s.contains("reduction")) cfg.session.reduction = s["reduction"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("typing_delay_s")) cfg.output.typing_delay_s = o["typing_delay_s"].get<double>();
        }

    } catch (const json::exception& e) {
        return std::unexpected(std::string("parse error in ") + path + ": " + e.what());
    }

    if (auto v = cfg.validate(); !v) {
        return std::unexpected(path + ": " + v.error());
    }
    return cfg;
}

std::expected<Config, std::string> Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::expected<void, std::string> Config::validate() const {
    if (backend.url.rfind("ws://", 0) != 0 && backend.url.rfind("wss://", 0) != 0) {
        return std::unexpected("backend.url must start with ws:// or wss://");
    }
    if (auto combo = parse_combo(hotkey.keys); !combo) {
        return std::unexpected("hotkey.keys: " + combo.error());
    }
    if (hotkey.cooldown_s < 0.0) {
        return std::unexpected("hotkey.cooldown_s must not be negative");
    }
    if (audio.sample_rate == 0 || audio.channels == 0) {
        return std::unexpected("audio.sample_rate and audio.channels must be positive");
    }
    if (audio.frame_samples() == 0) {
        return std::unexpected("audio.frame_ms is too short for the sample rate");
    }
    if (session.max_wait_s < 0.0) {
        return std::unexpected("session.max_wait_s must not be negative");
    }
    if (session.reduction != "last_final" && session.reduction != "concatenate") {
        return std::unexpected("session.reduction must be \"last_final\" or \"concatenate\"");
    }
    if (output.typing_delay_s < 0.0) {
        return std::unexpected("output.typing_delay_s must not be negative");
    }
    return {};
}
