/**
 * @file playable_poller.cpp
 * @brief Playable poller implementation
 */

#include "kcenon/video_uploader/upload/playable_poller.h"

#include "kcenon/video_uploader/core/logging.h"

#include <atomic>

namespace kcenon::video_uploader {

namespace {
constexpr int http_accepted = 202;
}  // namespace

struct playable_poller::impl {
    std::shared_ptr<http_transport> transport;
    std::chrono::milliseconds interval;
    cancellation_source stop_source;
    std::atomic<std::size_t> polls{0};

    impl(std::shared_ptr<http_transport> t, std::chrono::milliseconds i)
        : transport(std::move(t)), interval(i) {}
};

playable_poller::playable_poller(std::shared_ptr<http_transport> transport,
                                 std::chrono::milliseconds interval)
    : impl_(std::make_unique<impl>(std::move(transport), interval)) {}

playable_poller::~playable_poller() {
    stop();
}

void playable_poller::stop() {
    impl_->stop_source.cancel();
}

auto playable_poller::is_stopped() const -> bool {
    return impl_->stop_source.is_cancelled();
}

auto playable_poller::interval() const -> std::chrono::milliseconds {
    return impl_->interval;
}

auto playable_poller::poll_count() const -> std::size_t {
    return impl_->polls.load();
}

auto playable_poller::wait_until_playable(const video_upload_response& response,
                                          const playable_callback& on_playable) -> result<void> {
    if (!response.assets.hls || response.assets.hls->empty()) {
        return unexpected(error{error_code::invalid_configuration,
            "response has no hls asset to poll"});
    }

    const auto& url = *response.assets.hls;
    auto token = impl_->stop_source.token();

    upload_log_context ctx;
    ctx.video_id = response.video_id;
    ctx.endpoint = url;
    VU_LOG_DEBUG_CTX(log_category::poller, "waiting for video to become playable", ctx);

    while (true) {
        if (!token.wait_for(impl_->interval)) {
            return unexpected(error{error_code::aborted, "playable polling stopped"});
        }

        ++impl_->polls;
        auto result = impl_->transport->get(url, {}, token);
        if (!result) {
            if (result.error().code == error_code::aborted) {
                return unexpected(result.error());
            }
            VU_LOG_DEBUG(log_category::poller,
                "playable check failed: " + result.error().message);
            continue;
        }

        const auto& resp = result.value();
        if (resp.status_code == http_accepted || resp.body.empty()) {
            continue;
        }
        break;
    }

    VU_LOG_INFO_CTX(log_category::poller, "video is playable", ctx);

    if (on_playable) {
        on_playable(response);
    }
    return {};
}

}  // namespace kcenon::video_uploader
