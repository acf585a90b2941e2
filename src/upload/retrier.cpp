/**
 * @file retrier.cpp
 * @brief Retry loop implementation
 */

#include "kcenon/video_uploader/upload/retrier.h"

namespace kcenon::video_uploader {

auto make_default_retry_strategy(std::size_t max_retries) -> retry_strategy {
    return [max_retries](std::size_t retry_count, const error& err)
               -> std::optional<std::chrono::milliseconds> {
        if (err.http_status && *err.http_status >= 400 && *err.http_status < 500) {
            return std::nullopt;
        }
        // invalid_response means the chunk was stored; not_available never recovers.
        if (err.code == error_code::invalid_response || err.code == error_code::not_available) {
            return std::nullopt;
        }
        if (retry_count >= max_retries) {
            return std::nullopt;
        }
        return default_retry_delay(retry_count);
    };
}

retrier::retrier(retry_strategy strategy)
    : retrier(std::move(strategy),
              [](std::chrono::milliseconds delay, const cancellation_token& token) {
                  return token.wait_for(delay);
              }) {}

retrier::retrier(retry_strategy strategy, wait_function wait)
    : strategy_(std::move(strategy)), wait_(std::move(wait)) {}

auto retrier::aborted_error() -> error {
    return error{error_code::aborted, "upload aborted"};
}

void retrier::log_retry(const retry_state& state, const error& err,
                        std::chrono::milliseconds delay) {
    upload_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(state.attempts);
    ctx.retry_delay_ms = static_cast<uint64_t>(delay.count());
    ctx.http_status = err.http_status;
    ctx.error_message = err.message;

    VU_LOG_WARN_CTX(log_category::retrier,
        "video upload: " + err.reason() + ", will be retried in " +
        std::to_string(delay.count()) + " ms", ctx);
}

}  // namespace kcenon::video_uploader
