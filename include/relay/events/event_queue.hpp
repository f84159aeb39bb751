/**
 * @file event_queue.hpp
 * @brief Bounded thread-safe FIFO used to hand results between threads
 *
 * EXAMPLE:
 * ThreadSafeQueue<TransferResult> results(64);
 * results.push(result);        // worker thread
 * auto next = results.pop();   // host thread, blocks until available
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace relay::events {

/**
 * @brief Multi-producer, multi-consumer queue with optional capacity
 *
 * push() blocks while the queue is full. shutdown() releases every waiting
 * producer and consumer; pop() drains remaining items before returning
 * nullopt.
 */
template<typename T>
class ThreadSafeQueue {
public:
    /// capacity == 0 means unbounded
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// RETURNS: false if the queue was shut down before the item fit
    bool push(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return shutdown_ || !full(); });
        if (shutdown_) {
            return false;
        }
        queue_.push(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    bool full() const {
        return capacity_ != 0 && queue_.size() >= capacity_;
    }

    T take(std::unique_lock<std::mutex>& lock) {
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    std::size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace relay::events
