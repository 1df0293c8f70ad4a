#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

// WAV framing for PCM streamed over the recognizer connection.
namespace wav {

// RIFF and data sizes are unknown while streaming, so both carry 0xFFFFFFFF.
inline constexpr uint32_t kStreamingSize = 0xFFFFFFFF;
inline constexpr size_t kHeaderSize = 44;

inline std::vector<uint8_t> stream_header(uint32_t sample_rate, uint16_t channels) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = static_cast<uint16_t>(channels * bits_per_sample / 8);

    std::vector<uint8_t> out(kHeaderSize);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(kStreamingSize);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(kStreamingSize);

    return out;
}

} // namespace wav
