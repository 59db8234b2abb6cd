#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace loom {
namespace stream {

/**
 * @brief Thread-safe FIFO connecting a producing run to a consuming caller
 *
 * Design:
 * - Mutex + condition variables
 * - Optional capacity: push() blocks while full, so a slow consumer
 *   applies backpressure to the producer
 * - close() wakes everyone; pushes after close fail, pops drain what is
 *   left and then return nullopt
 */
template<typename T>
class EventChannel {
public:
    /**
     * @brief Construct channel with optional capacity limit
     *
     * @param capacity Maximum buffered items (0 = unlimited)
     */
    explicit EventChannel(size_t capacity = 0)
        : capacity_(capacity)
        , closed_(false)
    {}

    /**
     * @brief Push an item, waiting for space if the channel is full
     *
     * @return true if enqueued, false if the channel is closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || capacity_ == 0 || items_.size() < capacity_;
        });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop the next item (blocking)
     *
     * @return The item, or nullopt once the channel is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return !items_.empty() || closed_;
        });
        return take_locked();
    }

    /**
     * @brief Pop with timeout
     *
     * @return The item, or nullopt on timeout or once closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] {
            return !items_.empty() || closed_;
        });
        return take_locked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    /**
     * @brief Stop accepting items and wake blocked producers and consumers
     *
     * Items already buffered can still be popped.
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    size_t capacity_;
    bool closed_;
};

} // namespace stream
} // namespace loom
