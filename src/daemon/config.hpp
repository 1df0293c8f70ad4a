#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string url = "ws://localhost:8000/asr";
        uint32_t connect_timeout_s = 10;
        bool send_wav_header = true;
    } backend;

    struct Hotkey {
        std::vector<std::string> keys = {"ctrl_l", "alt_l", "r"};
        double cooldown_s = 0.5;
    } hotkey;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t channels = 1;
        uint32_t frame_ms = 100;
        uint32_t stall_timeout_ms = 2000;

        // Computed from the above (no independent config key).
        size_t frame_samples() const {
            return static_cast<size_t>(sample_rate) * frame_ms / 1000 * channels;
        }
    } audio;

    struct Session {
        double max_wait_s = 10.0;
        std::string reduction = "last_final"; // "last_final" or "concatenate"
    } session;

    struct Output {
        double typing_delay_s = 0.015;
    } output;

    // Missing file yields defaults. Malformed JSON, wrong value types and
    // invalid values are errors.
    static std::expected<Config, std::string> load(const std::string& path);
    static std::expected<Config, std::string> load_default();

    std::expected<void, std::string> validate() const;
};
