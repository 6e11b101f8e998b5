/**
 * @file channel.hpp
 * @brief Multi-producer FIFO channel between upload sessions and the caller
 *
 * Upload sessions push progress records from their own threads; the caller
 * drains them from whichever thread it likes. Closing the channel wakes
 * every blocked reader once the remaining items are consumed.
 *
 * EXAMPLE:
 * Channel<ProgressEvent> progress;
 * progress.push(event);          // session thread
 * while (auto e = progress.pop()) { ... }   // caller, ends after close()
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace skyup {

template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue an item; silently dropped once the channel is closed
     */
    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Blocking receive
     *
     * RETURNS: the next item, or nullopt once closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace skyup
