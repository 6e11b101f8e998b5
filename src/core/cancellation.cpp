#include "skyup/core/cancellation.hpp"

#include <vector>

namespace skyup {

void CancellationToken::cancel() {
    std::vector<Listener> to_run;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        for (auto& [id, listener] : listeners_) {
            to_run.push_back(std::move(listener));
        }
        listeners_.clear();
    }
    cv_.notify_all();

    // Listeners run without the lock so they may touch other tokens.
    for (auto& listener : to_run) {
        listener();
    }
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    if (duration.count() <= 0) {
        return cancelled_;
    }
    return cv_.wait_for(lock, duration, [this]() { return cancelled_; });
}

std::size_t CancellationToken::on_cancel(Listener listener) {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled_) {
            const auto id = next_listener_id_++;
            listeners_.emplace(id, std::move(listener));
            return id;
        }
    }
    listener();
    return static_cast<std::size_t>(-1);
}

void CancellationToken::remove_listener(std::size_t id) {
    std::lock_guard lock(mutex_);
    listeners_.erase(id);
}

} // namespace skyup
