#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <thread>

// Consumer side of a capture stream. The capture callback writes samples;
// read() cuts them into fixed-size frames, flushes the tail once after
// close(), and fails with ErrorKind::Device when the producer errors or
// stops delivering for longer than the stall timeout.
class CaptureBuffer {
public:
    CaptureBuffer(size_t frame_samples, size_t capacity_samples,
                  std::chrono::milliseconds stall_timeout)
        : frame_samples_(frame_samples), stall_timeout_(stall_timeout),
          ring_(capacity_samples) {}

    // Producer. Overflow drops the newest samples.
    size_t write(std::span<const int16_t> samples) { return ring_.write(samples); }

    // The producer is stopped for good. Wakes a blocked read().
    void close() { closed_.store(true, std::memory_order_release); }
    bool closed() const { return closed_.load(std::memory_order_acquire); }

    void fail() { failed_.store(true, std::memory_order_release); }

    std::expected<AudioFrame, Error> read() {
        auto last_data = std::chrono::steady_clock::now();
        size_t last_avail = ring_.available();

        while (true) {
            if (closed()) {
                // The producer is stopped once closed, so the tail is stable.
                if (tail_flushed_) {
                    return std::unexpected(Error{ErrorKind::Closed, "stream closed"});
                }
                tail_flushed_ = true;
                auto tail = ring_.drain_all();
                if (tail.empty()) {
                    return std::unexpected(Error{ErrorKind::Closed, "stream closed"});
                }
                return AudioFrame{.seq = next_seq_++, .samples = std::move(tail)};
            }

            if (failed_.load(std::memory_order_acquire)) {
                return std::unexpected(Error{ErrorKind::Device, "stream entered error state"});
            }

            auto samples = ring_.read_exact(frame_samples_);
            if (!samples.empty()) {
                return AudioFrame{.seq = next_seq_++, .samples = std::move(samples)};
            }

            auto now = std::chrono::steady_clock::now();
            size_t avail = ring_.available();
            if (avail != last_avail) {
                last_avail = avail;
                last_data = now;
            } else if (now - last_data > stall_timeout_) {
                return std::unexpected(Error{ErrorKind::Device, "no audio from capture device"});
            }

            std::this_thread::sleep_for(kPollInterval);
        }
    }

private:
    static constexpr auto kPollInterval = std::chrono::milliseconds(5);

    size_t frame_samples_;
    std::chrono::milliseconds stall_timeout_;
    RingBuffer ring_;
    uint64_t next_seq_ = 0;
    bool tail_flushed_ = false;

    std::atomic<bool> closed_{false};
    std::atomic<bool> failed_{false};
};
