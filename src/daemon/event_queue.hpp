#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Unbounded multi-producer queue drained by one consumer thread. Every item
// is stamped with the time it was pushed.
template <typename T>
class EventQueue {
public:
    using Clock = std::chrono::steady_clock;

    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            items_.emplace_back(Clock::now(), std::move(value));
        }
        cv_.notify_one();
    }

    T pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        return take_front();
    }

    // Next item pushed before `deadline`. std::nullopt once the deadline
    // passes without one; items pushed later stay queued for pop().
    std::optional<T> pop_until(Clock::time_point deadline) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return !items_.empty(); });
        if (items_.empty() || items_.front().first >= deadline) {
            return std::nullopt;
        }
        return take_front();
    }

private:
    T take_front() {
        T value = std::move(items_.front().second);
        items_.pop_front();
        return value;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::pair<Clock::time_point, T>> items_;
};
