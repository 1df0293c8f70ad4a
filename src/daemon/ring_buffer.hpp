#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of int16 samples.
// Producer (PipeWire RT thread) calls write(). Consumer (frame pump) calls read().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. Overflow drops the newest data.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t to_write = std::min(samples.size(), capacity_ - (w - r));
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, samples.data(), first * sizeof(int16_t));
        if (first < to_write) {
            std::memcpy(buf_.data(), samples.data() + first, (to_write - first) * sizeof(int16_t));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: copies up to dest.size() samples. Returns samples read.
    size_t read(std::span<int16_t> dest) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(dest.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dest.data(), buf_.data() + offset, first * sizeof(int16_t));
        if (first < to_read) {
            std::memcpy(dest.data() + first, buf_.data(), (to_read - first) * sizeof(int16_t));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: pops exactly n samples, or nothing if fewer are buffered.
    std::vector<int16_t> read_exact(size_t n) {
        if (n == 0 || available() < n) return {};
        std::vector<int16_t> out(n);
        read(out);
        return out;
    }

    // Consumer: everything currently buffered.
    std::vector<int16_t> drain_all() {
        std::vector<int16_t> out(available());
        if (!out.empty()) read(out);
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
