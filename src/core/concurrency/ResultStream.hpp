#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace signfleet::core {

/**
 * @brief Closable queue streaming results from producers to one consumer.
 *
 * Producers push() without ever blocking; the consumer pulls with next()
 * until it returns nullopt, which happens once the stream is closed and
 * drained. Items pushed after close() are dropped.
 *
 * @tparam T Item type.
 */
template <typename T>
class ResultStream {
public:
    /**
     * @brief Appends an item unless the stream is closed.
     * @return True if the item was queued.
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Marks the stream complete. Queued items remain readable.
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Blocks until an item is available or the stream is finished.
     * @return The next item, or nullopt once closed and drained.
     */
    std::optional<T> next() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return popLocked();
    }

    /**
     * @brief Like next(), but gives up after a timeout.
     * @return The next item, or nullopt on timeout or when finished.
     */
    std::optional<T> nextFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; });
        return popLocked();
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace signfleet::core
