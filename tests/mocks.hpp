#pragma once

#include "output/output.hpp"
#include "platform/audio_source.hpp"
#include "platform/key_injector.hpp"
#include "platform/key_source.hpp"
#include "transcription/channel.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Shared knobs and counters for MockAudioSource and the streams it opens.
struct AudioScript {
    std::mutex mutex;
    size_t frame_samples = 160;
    std::chrono::milliseconds frame_interval{5};
    int fail_after = -1;        // frames before a Device error, -1 = never
    size_t tail_samples = 0;    // short frame returned once after close()
    bool fail_open = false;
    int opens = 0;
    bool closed = false;
};

class MockAudioStream : public AudioStream {
public:
    explicit MockAudioStream(std::shared_ptr<AudioScript> script) : script_(std::move(script)) {}

    std::expected<AudioFrame, Error> read() override {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, script_->frame_interval, [this] { return closed_; });

        if (closed_) {
            if (!tail_sent_ && script_->tail_samples > 0) {
                tail_sent_ = true;
                return AudioFrame{.seq = seq_++, .samples = std::vector<int16_t>(script_->tail_samples, 1)};
            }
            return std::unexpected(Error{ErrorKind::Closed, "closed"});
        }
        if (script_->fail_after >= 0 && seq_ >= static_cast<uint64_t>(script_->fail_after)) {
            return std::unexpected(Error{ErrorKind::Device, "microphone unplugged"});
        }
        return AudioFrame{.seq = seq_++, .samples = std::vector<int16_t>(script_->frame_samples, 0)};
    }

    void close() override {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
        std::lock_guard lock(script_->mutex);
        script_->closed = true;
    }

private:
    std::shared_ptr<AudioScript> script_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    bool tail_sent_ = false;
    uint64_t seq_ = 0;
};

class MockAudioSource : public AudioSource {
public:
    std::shared_ptr<AudioScript> script = std::make_shared<AudioScript>();

    std::expected<std::unique_ptr<AudioStream>, Error> open(const AudioFormat& /*format*/) override {
        std::lock_guard lock(script->mutex);
        if (script->fail_open) {
            return std::unexpected(Error{ErrorKind::Device, "no microphone"});
        }
        script->opens++;
        script->closed = false;
        return std::make_unique<MockAudioStream>(script);
    }
};

// Scripted recognizer peer. Everything is guarded by one mutex so the pump,
// collector and controller threads can all touch it.
struct ChannelScript {
    std::mutex mutex;
    std::condition_variable cv;

    std::deque<TranscriptEvent> queued;            // delivered right away
    std::vector<TranscriptEvent> on_end_of_audio;  // queued when audio ends
    bool close_on_end_of_audio = true;             // peer hangs up after those
    std::optional<TranscriptEvent> late_event;     // delivered late_delay after end of audio
    std::chrono::milliseconds late_delay{0};
    int fail_send_after = -1;

    // Observations
    size_t frames = 0;
    size_t samples = 0;
    int end_of_audio_calls = 0;
    bool interrupted = false;
    bool closed = false;
    bool used_after_close = false;
    std::optional<std::chrono::steady_clock::time_point> end_of_audio_at;
    bool peer_closed = false;
};

class MockChannel : public TranscriptionChannel {
public:
    explicit MockChannel(std::shared_ptr<ChannelScript> s) : s_(std::move(s)) {}

    std::expected<void, Error> send(AudioFrame frame) override {
        std::lock_guard lock(s_->mutex);
        if (s_->closed) s_->used_after_close = true;
        if (s_->fail_send_after >= 0 && s_->frames >= static_cast<size_t>(s_->fail_send_after)) {
            return std::unexpected(Error{ErrorKind::Send, "connection reset"});
        }
        s_->frames++;
        s_->samples += frame.samples.size();
        return {};
    }

    std::optional<TranscriptEvent> next_event() override {
        std::unique_lock lock(s_->mutex);
        while (true) {
            if (s_->interrupted || s_->closed) return std::nullopt;
            if (!s_->queued.empty()) {
                auto ev = s_->queued.front();
                s_->queued.pop_front();
                return ev;
            }

            if (s_->late_event && s_->end_of_audio_at) {
                auto due = *s_->end_of_audio_at + s_->late_delay;
                if (std::chrono::steady_clock::now() >= due) {
                    s_->queued.push_back(*s_->late_event);
                    s_->late_event.reset();
                    continue;
                }
                s_->cv.wait_until(lock, due);
                continue;
            }

            if (s_->peer_closed) return std::nullopt;
            s_->cv.wait(lock);
        }
    }

    std::expected<void, Error> signal_end_of_audio() override {
        {
            std::lock_guard lock(s_->mutex);
            if (s_->closed) s_->used_after_close = true;
            s_->end_of_audio_calls++;
            s_->end_of_audio_at = std::chrono::steady_clock::now();
            for (auto& ev : s_->on_end_of_audio) s_->queued.push_back(ev);
            if (s_->close_on_end_of_audio && !s_->late_event) s_->peer_closed = true;
        }
        s_->cv.notify_all();
        return {};
    }

    void interrupt() override {
        {
            std::lock_guard lock(s_->mutex);
            s_->interrupted = true;
        }
        s_->cv.notify_all();
    }

    void close() override {
        {
            std::lock_guard lock(s_->mutex);
            s_->closed = true;
        }
        s_->cv.notify_all();
    }

private:
    std::shared_ptr<ChannelScript> s_;
};

class MockConnector : public ChannelConnector {
public:
    std::shared_ptr<ChannelScript> script = std::make_shared<ChannelScript>();
    bool fail = false;
    std::chrono::milliseconds connect_delay{0};   // slow handshake
    std::atomic<int> connects{0};
    std::string last_endpoint;

    std::expected<std::unique_ptr<TranscriptionChannel>, Error>
    connect(const std::string& endpoint) override {
        if (connect_delay.count() > 0) std::this_thread::sleep_for(connect_delay);
        connects++;
        last_endpoint = endpoint;
        if (fail) {
            return std::unexpected(Error{ErrorKind::Connect, "connection refused"});
        }
        return std::make_unique<MockChannel>(script);
    }
};

class RecordingOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text) override {
        std::lock_guard lock(mutex_);
        delivered_.push_back(text);
        if (fail) return std::unexpected(std::string("typing failed"));
        return {};
    }

    std::vector<std::string> delivered() const {
        std::lock_guard lock(mutex_);
        return delivered_;
    }

    bool fail = false;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> delivered_;
};

// Records each injected character with the time it was typed.
class MockInjector : public KeyInjector {
public:
    struct Press {
        std::string glyph;
        std::chrono::steady_clock::time_point at;
    };

    std::expected<void, Error> type_char(std::string_view glyph) override {
        presses.push_back({std::string(glyph), std::chrono::steady_clock::now()});
        if (fail_glyph && *fail_glyph == glyph) {
            return std::unexpected(Error{ErrorKind::Injection, "virtual keyboard refused"});
        }
        return {};
    }

    std::vector<Press> presses;
    std::optional<std::string> fail_glyph;
};

// Replays a fixed list of key events, then reports the source closed.
class ScriptedKeySource : public KeyEventSource {
public:
    explicit ScriptedKeySource(std::vector<KeyEvent> events) : events_(events.begin(), events.end()) {}

    std::optional<KeyEvent> next() override {
        if (events_.empty()) return std::nullopt;
        auto ev = events_.front();
        events_.pop_front();
        return ev;
    }

    void interrupt() override { events_.clear(); }

private:
    std::deque<KeyEvent> events_;
};
