#pragma once

#include "capture_buffer.hpp"
#include "platform/audio_source.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireStream : public AudioStream {
public:
    PipeWireStream(const AudioFormat& format, std::chrono::milliseconds stall_timeout);
    ~PipeWireStream() override;

    PipeWireStream(const PipeWireStream&) = delete;
    PipeWireStream& operator=(const PipeWireStream&) = delete;

    // Connects the capture stream and starts the PipeWire thread loop.
    std::expected<void, Error> start();

    std::expected<AudioFrame, Error> read() override;
    void close() override;

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    AudioFormat format_;
    CaptureBuffer buffer_;

    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};

class PipeWireSource : public AudioSource {
public:
    explicit PipeWireSource(std::chrono::milliseconds stall_timeout);
    ~PipeWireSource() override;

    PipeWireSource(const PipeWireSource&) = delete;
    PipeWireSource& operator=(const PipeWireSource&) = delete;

    std::expected<std::unique_ptr<AudioStream>, Error> open(const AudioFormat& format) override;

private:
    std::chrono::milliseconds stall_timeout_;
};
