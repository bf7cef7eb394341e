#pragma once

/** \file bounded_channel.hpp
 *  \brief Bounded multi-producer multi-consumer queue.
 *
 * send() blocks while the channel is full; this is the only backpressure
 * mechanism between producers and the trainer. receive_for() waits for the
 * next value, the timeout, or close(), whichever comes first.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace kestrel::core {

enum class channel_status { ok, timeout, closed };

template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /** \brief Block until there is room; false when the channel is closed. */
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /** \brief Enqueue without blocking; false when full or closed. */
    bool try_send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) return false;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /** \brief Wait up to `timeout` for a value. Remaining values drain after close(). */
    template <typename Rep, typename Period>
    channel_status receive_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
            return channel_status::timeout;
        }
        if (queue_.empty()) return channel_status::closed;
        out = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return channel_status::ok;
    }

    /** \brief Reject further sends and wake every waiter. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace kestrel::core
