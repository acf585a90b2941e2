/**
 * @file playable_poller.h
 * @brief Polls a video's HLS manifest until it can be played
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_PLAYABLE_POLLER_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_PLAYABLE_POLLER_H

#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/types.h>
#include <kcenon/video_uploader/transport/http_transport.h>
#include <kcenon/video_uploader/upload/upload_types.h>

#include <chrono>
#include <cstddef>
#include <memory>

namespace kcenon::video_uploader {

/**
 * @brief Waits until the HLS asset of an uploaded video is served
 *
 * Polls assets.hls every interval until the response is not 202 and has a
 * non-empty body. There is no attempt limit and no per-upload
 * cancellation; polling only ends on success or when stop() is called.
 * Transport errors are logged and polling continues.
 */
class playable_poller {
public:
    static constexpr std::chrono::milliseconds default_interval{500};

    explicit playable_poller(std::shared_ptr<http_transport> transport,
                             std::chrono::milliseconds interval = default_interval);

    ~playable_poller();

    playable_poller(const playable_poller&) = delete;
    auto operator=(const playable_poller&) -> playable_poller& = delete;

    /**
     * @brief Block until the video is playable, then call on_playable once
     * @return Success, or
     *         - invalid_configuration if the response has no HLS asset
     *         - aborted if stop() was called
     */
    [[nodiscard]] auto wait_until_playable(const video_upload_response& response,
                                           const playable_callback& on_playable) -> result<void>;

    /**
     * @brief Interrupt every running and future wait
     */
    void stop();

    [[nodiscard]] auto is_stopped() const -> bool;

    [[nodiscard]] auto interval() const -> std::chrono::milliseconds;

    /**
     * @brief Number of GET requests issued so far
     */
    [[nodiscard]] auto poll_count() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_PLAYABLE_POLLER_H
