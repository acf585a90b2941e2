/**
 * @file cancellation.h
 * @brief Cooperative cancellation for upload operations
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_CANCELLATION_H
#define KCENON_VIDEO_UPLOADER_CORE_CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kcenon::video_uploader {

namespace detail {
struct cancellation_state;
}  // namespace detail

/**
 * @brief Read side of a cancellation signal
 *
 * Tokens are cheap to copy and all copies observe the same signal. A
 * default constructed token is never cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Sleep for the given delay or until cancelled
     * @return true if the full delay elapsed, false if cancelled
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds delay) const -> bool;

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state);

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief Owner side of a cancellation signal
 *
 * cancel() is idempotent and wakes every waiter.
 *
 * @code
 * cancellation_source source;
 * auto token = source.token();
 * std::thread worker([token] {
 *     if (!token.wait_for(std::chrono::seconds(5))) {
 *         return;  // cancelled
 *     }
 * });
 * source.cancel();
 * worker.join();
 * @endcode
 */
class cancellation_source {
public:
    cancellation_source();

    [[nodiscard]] auto token() const -> cancellation_token;

    /**
     * @brief Raise the signal
     * @return true if this call raised it, false if already cancelled
     */
    auto cancel() -> bool;

    [[nodiscard]] auto is_cancelled() const -> bool;

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_CORE_CANCELLATION_H
