#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace skyup {

/**
 * @brief Cooperative cancellation flag shared between a caller and the
 * tasks working on its behalf
 *
 * Tasks poll is_cancelled() between units of work and use wait_for() for
 * every sleep so that a cancel() wakes them immediately. Listeners added
 * with on_cancel() run once, on the thread that calls cancel(), or right
 * away when the token is already cancelled.
 */
class CancellationToken {
public:
    using Listener = std::function<void()>;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief Sleep for `duration` unless cancelled first
     *
     * RETURNS: true if the token was cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds duration) const;

    std::size_t on_cancel(Listener listener);
    void remove_listener(std::size_t id);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::size_t next_listener_id_ = 0;
    std::map<std::size_t, Listener> listeners_;
};

} // namespace skyup
