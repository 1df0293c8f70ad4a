#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// Seconds of audio the ring holds before the producer starts dropping.
constexpr size_t kRingSeconds = 10;

} // namespace

PipeWireStream::PipeWireStream(const AudioFormat& format, std::chrono::milliseconds stall_timeout)
    : format_(format),
      buffer_(format.frame_samples(),
              static_cast<size_t>(format.sample_rate) * format.channels * kRingSeconds,
              stall_timeout) {}

PipeWireStream::~PipeWireStream() {
    close();
}

std::expected<void, Error> PipeWireStream::start() {
    loop_ = pw_thread_loop_new("keyscribe", nullptr);
    if (!loop_) {
        return std::unexpected(Error{ErrorKind::Device, "failed to create thread loop"});
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "keyscribe",
        PW_KEY_APP_NAME, "keyscribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "keyscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected(Error{ErrorKind::Device, "failed to create stream"});
    }

    // S16_LE at the configured rate and channel count
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = format_.sample_rate,
        .channels = format_.channels
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(Error{ErrorKind::Device,
            std::string("stream connect failed: ") + spa_strerror(ret)});
    }

    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(Error{ErrorKind::Device,
            std::string("thread loop start failed: ") + spa_strerror(ret)});
    }

    return {};
}

std::expected<AudioFrame, Error> PipeWireStream::read() {
    return buffer_.read();
}

void PipeWireStream::close() {
    if (buffer_.closed()) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
    buffer_.close();
}

void PipeWireStream::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireStream::on_process(void* userdata) {
    auto* self = static_cast<PipeWireStream*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->buffer_.write({data, count});
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireStream::on_state_changed(void* userdata, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireStream*>(userdata);
    if (state == PW_STREAM_STATE_ERROR) {
        self->buffer_.fail();
    }
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}

PipeWireSource::PipeWireSource(std::chrono::milliseconds stall_timeout)
    : stall_timeout_(stall_timeout) {
    pw_init(nullptr, nullptr);
}

PipeWireSource::~PipeWireSource() {
    pw_deinit();
}

std::expected<std::unique_ptr<AudioStream>, Error>
PipeWireSource::open(const AudioFormat& format) {
    auto stream = std::make_unique<PipeWireStream>(format, stall_timeout_);
    if (auto res = stream->start(); !res) {
        return std::unexpected(res.error());
    }
    return stream;
}
