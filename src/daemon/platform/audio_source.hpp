#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>

struct AudioFormat {
    uint32_t sample_rate = 16000;
    uint32_t channels = 1;
    uint32_t frame_ms = 100;

    size_t frame_samples() const {
        return static_cast<size_t>(sample_rate) * frame_ms / 1000 * channels;
    }
};

// An open microphone stream.
class AudioStream {
public:
    virtual ~AudioStream() = default;

    // Blocks until a full frame is buffered. Fails with ErrorKind::Device when
    // the device errors or stalls. After close(), returns the buffered tail
    // once as a short frame, then fails with ErrorKind::Closed.
    virtual std::expected<AudioFrame, Error> read() = 0;

    // Idempotent. Wakes a blocked read().
    virtual void close() = 0;
};

class AudioSource {
public:
    virtual ~AudioSource() = default;
    virtual std::expected<std::unique_ptr<AudioStream>, Error> open(const AudioFormat& format) = 0;
};
