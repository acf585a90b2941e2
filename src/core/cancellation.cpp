/**
 * @file cancellation.cpp
 * @brief Implementation of cooperative cancellation
 */

#include <kcenon/video_uploader/core/cancellation.h>

#include <thread>

namespace kcenon::video_uploader {

namespace detail {

struct cancellation_state {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

}  // namespace detail

// cancellation_token

cancellation_token::cancellation_token(std::shared_ptr<detail::cancellation_state> state)
    : state_(std::move(state)) {}

auto cancellation_token::is_cancelled() const -> bool {
    if (!state_) {
        return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::wait_for(std::chrono::milliseconds delay) const -> bool {
    if (!state_) {
        std::this_thread::sleep_for(delay);
        return true;
    }

    std::unique_lock lock(state_->mutex);
    bool cancelled = state_->cv.wait_for(lock, delay, [this] { return state_->cancelled; });
    return !cancelled;
}

// cancellation_source

cancellation_source::cancellation_source()
    : state_(std::make_shared<detail::cancellation_state>()) {}

auto cancellation_source::token() const -> cancellation_token {
    return cancellation_token(state_);
}

auto cancellation_source::cancel() -> bool {
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
    }
    state_->cv.notify_all();
    return true;
}

auto cancellation_source::is_cancelled() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace kcenon::video_uploader
