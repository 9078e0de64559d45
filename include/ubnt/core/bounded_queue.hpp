/**
 * @file bounded_queue.hpp
 * @brief Bounded multi-producer / single-consumer queue.
 *
 * Carries datagrams from the socket receiver thread to the scan thread.
 * When full, the incoming item is rejected and counted, so a flood of
 * replies cannot grow memory without bound.
 *
 * Copyright (c) 2024 UBNT Discovery Contributors
 * License: MIT
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace ubnt {
namespace core {

/**
 * @brief Result of a push operation.
 */
enum class PushResult {
    ENQUEUED,        ///< Item queued
    DROPPED_NEWEST,  ///< Item rejected (queue full)
    CLOSED           ///< Queue closed, item rejected
};

/**
 * @brief Counters for a bounded queue.
 */
struct QueueStats {
    size_t current_depth = 0;
    size_t limit = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_delivered = 0;
    uint64_t dropped = 0;
    size_t high_watermark = 0;
};

/**
 * @brief Thread-safe bounded FIFO.
 *
 * @tparam T Item type (e.g. Datagram)
 */
template<typename T>
class BoundedQueue {
public:
    /**
     * @param limit Maximum queued items (0 = unlimited).
     */
    explicit BoundedQueue(size_t limit = 256)
        : limit_(limit)
    {}

    ~BoundedQueue() {
        close();
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    PushResult push(T item) {
        if (closed_.load()) {
            return PushResult::CLOSED;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (limit_ > 0 && items_.size() >= limit_) {
                stats_.dropped++;
                return PushResult::DROPPED_NEWEST;
            }

            items_.push_back(std::move(item));
            stats_.total_enqueued++;
            if (items_.size() > stats_.high_watermark) {
                stats_.high_watermark = items_.size();
            }
        }

        cv_.notify_one();
        return PushResult::ENQUEUED;
    }

    /**
     * @brief Take the next item without waiting.
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    /**
     * @brief Take the next item, waiting up to @p timeout for one to arrive.
     * @return The item, or nullopt on timeout or when closed and drained.
     */
    template<typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return closed_.load() || !items_.empty();
        });
        return popLocked();
    }

    QueueStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        QueueStats result = stats_;
        result.current_depth = items_.size();
        result.limit = limit_;
        return result;
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
     * @brief Reject further pushes and wake a waiting consumer.
     *
     * Items already queued can still be popped.
     */
    void close() {
        closed_.store(true);
        cv_.notify_all();
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        stats_.total_delivered++;
        return item;
    }

    size_t limit_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::atomic<bool> closed_{false};
    QueueStats stats_;
};

}  // namespace core
}  // namespace ubnt
