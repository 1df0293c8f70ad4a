#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "keyscribe_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) {
            ssize_t n = ::write(fd, content.data(), content.size());
            (void)n;
            ::close(fd);
        }
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.url == "ws://localhost:8000/asr");
        REQUIRE(cfg.backend.connect_timeout_s == 10);
        REQUIRE(cfg.backend.send_wav_header);
        REQUIRE(cfg.hotkey.keys == std::vector<std::string>{"ctrl_l", "alt_l", "r"});
        REQUIRE(cfg.hotkey.cooldown_s == 0.5);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.frame_ms == 100);
        REQUIRE(cfg.audio.frame_samples() == 1600);
        REQUIRE(cfg.session.max_wait_s == 10.0);
        REQUIRE(cfg.session.reduction == "last_final");
        REQUIRE(cfg.output.typing_delay_s == 0.015);
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "url": "wss://asr.example.net/asr",
                "connect_timeout_s": 3,
                "send_wav_header": false
            },
            "hotkey": { "keys": ["super", "space"], "cooldown_s": 0.25 },
            "audio": { "sample_rate": 48000, "channels": 2, "frame_ms": 20, "stall_timeout_ms": 500 },
            "session": { "max_wait_s": 2.5, "reduction": "concatenate" },
            "output": { "typing_delay_s": 0.0 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->backend.url == "wss://asr.example.net/asr");
        REQUIRE(cfg->backend.connect_timeout_s == 3);
        REQUIRE_FALSE(cfg->backend.send_wav_header);
        REQUIRE(cfg->hotkey.keys == std::vector<std::string>{"super", "space"});
        REQUIRE(cfg->hotkey.cooldown_s == 0.25);
        REQUIRE(cfg->audio.sample_rate == 48000);
        REQUIRE(cfg->audio.channels == 2);
        REQUIRE(cfg->audio.stall_timeout_ms == 500);
        REQUIRE(cfg->audio.frame_samples() == 1920);
        REQUIRE(cfg->session.max_wait_s == 2.5);
        REQUIRE(cfg->session.reduction == "concatenate");
        REQUIRE(cfg->output.typing_delay_s == 0.0);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "session": { "max_wait_s": 4 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->session.max_wait_s == 4.0);
        // Other fields retain defaults
        REQUIRE(cfg->backend.url == "ws://localhost:8000/asr");
        REQUIRE(cfg->session.reduction == "last_final");
        REQUIRE(cfg->audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");
        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().find("parse error") != std::string::npos);
    }

    SECTION("WrongValueTypeIsError") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");
        REQUIRE_FALSE(Config::load(f.path).has_value());
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/keyscribe_test_nonexistent_config_file.json");
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->backend.url == "ws://localhost:8000/asr");
        REQUIRE(cfg->audio.sample_rate == 16000);
    }

    SECTION("UnknownKeyNameRejected") {
        TmpFile f(R"({ "hotkey": { "keys": ["ctrl_l", "hyper"] } })");
        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().find("hyper") != std::string::npos);
    }

    SECTION("EmptyComboRejected") {
        TmpFile f(R"({ "hotkey": { "keys": [] } })");
        REQUIRE_FALSE(Config::load(f.path).has_value());
    }

    SECTION("UnknownReductionRejected") {
        TmpFile f(R"({ "session": { "reduction": "average" } })");
        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().find("session.reduction") != std::string::npos);
    }

    SECTION("NonWebSocketUrlRejected") {
        TmpFile f(R"({ "backend": { "url": "http://localhost:8000/asr" } })");
        REQUIRE_FALSE(Config::load(f.path).has_value());
    }

    SECTION("NegativeValuesRejected") {
        Config cfg;
        cfg.session.max_wait_s = -1.0;
        REQUIRE_FALSE(cfg.validate().has_value());

        cfg = Config{};
        cfg.hotkey.cooldown_s = -0.1;
        REQUIRE_FALSE(cfg.validate().has_value());

        cfg = Config{};
        cfg.output.typing_delay_s = -0.01;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("ZeroMaxWaitAllowed") {
        Config cfg;
        cfg.session.max_wait_s = 0.0;
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("TooShortFrameRejected") {
        Config cfg;
        cfg.audio.sample_rate = 8000;
        cfg.audio.frame_ms = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }
}
