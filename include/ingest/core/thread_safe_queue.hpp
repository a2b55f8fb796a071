/**
 * @file thread_safe_queue.hpp
 * @brief Blocking FIFO used to hand work to background threads
 *
 * EXAMPLE:
 * ThreadSafeQueue<Span> queue;
 * queue.push(span);                 // producer, never blocks
 * while (auto item = queue.pop()) { // consumer, blocks until item or shutdown
 *     persist(*item);
 * }
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace ingest {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Blocks until an item is available
     *
     * RETURNS: nullopt once shutdown() was called and the queue drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        return take_locked();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Wakes every waiting consumer; remaining items can still be popped.
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace ingest
