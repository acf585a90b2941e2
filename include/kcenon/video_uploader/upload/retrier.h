/**
 * @file retrier.h
 * @brief Retry loop with pluggable backoff strategy and cancellation
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_RETRIER_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_RETRIER_H

#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/logging.h>
#include <kcenon/video_uploader/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::video_uploader {

/**
 * @brief Decides whether and when a failed attempt is retried
 * @param retry_count Number of retries already performed (0 on first failure)
 * @param err Error of the failed attempt
 * @return Delay before the next attempt, or nullopt to stop
 */
using retry_strategy =
    std::function<std::optional<std::chrono::milliseconds>(std::size_t retry_count, const error& err)>;

/// Default number of retries per request
inline constexpr std::size_t default_max_retries = 6;

/**
 * @brief Delay of the default strategy for a given retry count
 *
 * floor(200 + 2000 * n * (n + 1)) ms: 200, 4200, 12200, 24200...
 */
[[nodiscard]] constexpr auto default_retry_delay(std::size_t retry_count) -> std::chrono::milliseconds {
    auto n = static_cast<int64_t>(retry_count);
    return std::chrono::milliseconds(200 + 2000 * n * (n + 1));
}

/**
 * @brief Build the default retry strategy
 *
 * Client errors (HTTP 4xx), invalid_response and not_available stop
 * immediately. Anything else is retried while retry_count < max_retries,
 * with default_retry_delay().
 */
[[nodiscard]] auto make_default_retry_strategy(std::size_t max_retries = default_max_retries)
    -> retry_strategy;

/**
 * @brief Explicit retry bookkeeping for one request
 */
struct retry_state {
    std::size_t retry_count = 0;
    std::size_t attempts = 0;
};

/**
 * @brief Runs a fallible action until success, a stop decision or cancellation
 *
 * The retrier holds no per-request state; callers pass a retry_state when
 * they want to observe it.
 *
 * @code
 * retrier r(make_default_retry_strategy(6));
 * auto res = r.run<video_upload_response>(
 *     [&](const cancellation_token& t) { return executor.execute(request, t, nullptr); },
 *     source.token());
 * @endcode
 */
class retrier {
public:
    /**
     * @brief Blocks for a delay; returns false if cancelled during the wait
     */
    using wait_function =
        std::function<bool(std::chrono::milliseconds delay, const cancellation_token& token)>;

    explicit retrier(retry_strategy strategy);

    retrier(retry_strategy strategy, wait_function wait);

    template <typename T>
    [[nodiscard]] auto run(const std::function<result<T>(const cancellation_token&)>& action,
                           const cancellation_token& token,
                           retry_state* state = nullptr) const -> result<T> {
        retry_state local_state;
        retry_state& st = state ? *state : local_state;

        while (true) {
            if (token.is_cancelled()) {
                return unexpected(aborted_error());
            }

            ++st.attempts;
            auto outcome = action(token);
            if (outcome.has_value()) {
                return outcome;
            }

            const auto& err = outcome.error();
            if (token.is_cancelled() || err.code == error_code::aborted) {
                return unexpected(aborted_error());
            }

            auto delay = strategy_ ? strategy_(st.retry_count, err) : std::nullopt;
            if (!delay) {
                return outcome;
            }

            log_retry(st, err, *delay);

            if (!wait_(*delay, token)) {
                return unexpected(aborted_error());
            }
            ++st.retry_count;
        }
    }

private:
    static auto aborted_error() -> error;

    static void log_retry(const retry_state& state, const error& err,
                          std::chrono::milliseconds delay);

    retry_strategy strategy_;
    wait_function wait_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_RETRIER_H
