/**
 * @file video_upload_client.h
 * @brief Public entry point for chunked video uploads
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_VIDEO_UPLOAD_CLIENT_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_VIDEO_UPLOAD_CLIENT_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/video_uploader/core/types.h"
#include "kcenon/video_uploader/upload/observer_list.h"
#include "kcenon/video_uploader/upload/upload_types.h"
#include "kcenon/video_uploader/upload/uploader_config.h"

namespace kcenon::video_uploader {

class video_upload_client;

/**
 * @brief Handle for one running upload
 *
 * Copies share the same operation. The handle stays usable after the
 * uploader is destroyed; the operation is then settled.
 *
 * @code
 * auto handle = uploader.upload();
 * if (handle) {
 *     auto response = handle.value().wait();
 *     if (response) {
 *         std::cout << response.value().video_id << "\n";
 *     }
 * }
 * @endcode
 */
class upload_handle {
public:
    upload_handle() = default;

    [[nodiscard]] auto id() const -> const std::string&;

    [[nodiscard]] auto is_valid() const noexcept -> bool;

    /**
     * @brief Request cancellation
     * @return true if this call cancelled a running operation. Repeated
     *         calls and calls after the operation settled return false.
     */
    auto cancel() -> bool;

    /**
     * @brief Block until the operation settles
     */
    [[nodiscard]] auto wait() const -> result<video_upload_response>;

    /**
     * @brief Block until the operation settles or the timeout expires
     * @return Operation outcome, or wait_timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> result<video_upload_response>;

    [[nodiscard]] auto status() const -> upload_status;

    /**
     * @brief Video id known so far (assigned by the first chunk response)
     */
    [[nodiscard]] auto video_id() const -> std::optional<std::string>;

private:
    friend class video_upload_client;

    struct state;
    explicit upload_handle(std::shared_ptr<state> s);

    std::shared_ptr<state> state_;
};

/**
 * @brief Chunked video uploader
 *
 * Splits a file into chunks and uploads them one after another with
 * retries, token refresh and progress reporting.
 *
 * @code
 * auto uploader = video_upload_client::builder()
 *     .with_upload_token("to1234")
 *     .with_file("/videos/clip.mp4")
 *     .with_chunk_size(10 * 1024 * 1024)
 *     .build();
 *
 * if (uploader.has_value()) {
 *     uploader.value().on_progress([](const upload_progress_event& e) {
 *         std::cout << e.uploaded_bytes << "/" << e.total_bytes << "\n";
 *     });
 *     auto handle = uploader.value().upload();
 * }
 * @endcode
 */
class video_upload_client {
public:
    /**
     * @brief Builder for video_upload_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Authenticate with a delegated upload token
         * @param token Upload token
         * @param video_id Existing video to upload into (optional)
         */
        auto with_upload_token(std::string token,
                               std::optional<std::string> video_id = std::nullopt) -> builder&;

        /**
         * @brief Authenticate with an access token
         * @param token Access token, sent as Bearer
         * @param video_id Video to upload into (required)
         * @param refresh_token Enables refresh on 401 when present
         */
        auto with_access_token(std::string token,
                               std::string video_id,
                               std::optional<std::string> refresh_token = std::nullopt) -> builder&;

        /**
         * @brief Authenticate with an API key
         * @param api_key API key, sent as Basic
         * @param video_id Video to upload into (required)
         */
        auto with_api_key(std::string api_key, std::string video_id) -> builder&;

        auto with_credentials(upload_credentials credentials) -> builder&;

        auto with_file(std::filesystem::path path) -> builder&;

        /**
         * @brief File name sent to the server (default: the file's base name)
         */
        auto with_video_name(std::string name) -> builder&;

        /**
         * @brief Set chunk size
         * @param size Chunk size in bytes, 5MiB to 128MiB (default: 50MiB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Retries per chunk for the default strategy (default: 6)
         */
        auto with_max_retries(std::size_t retries) -> builder&;

        auto with_retry_strategy(retry_strategy strategy) -> builder&;

        auto with_origin_app(std::string name, std::string version) -> builder&;

        auto with_origin_sdk(std::string name, std::string version) -> builder&;

        /**
         * @brief API host without scheme (default: ws.api.video)
         */
        auto with_api_host(std::string host) -> builder&;

        auto with_transport(std::shared_ptr<http_transport> transport) -> builder&;

        auto with_registry(std::shared_ptr<operation_registry> registry) -> builder&;

        /**
         * @brief Enable or disable playable polling
         * @param enable Poll after upload when playable observers exist (default: true)
         * @param interval Delay between polls (default: 500ms)
         */
        auto with_playable_polling(bool enable,
                                   std::chrono::milliseconds interval =
                                       playable_poller::default_interval) -> builder&;

        /**
         * @brief Build without contacting the API
         *
         * Credentials become optional and upload() returns upload_disabled.
         */
        auto with_skip_upload(bool skip) -> builder&;

        /**
         * @brief Build the uploader instance
         * @return Uploader, or a configuration error
         */
        [[nodiscard]] auto build() -> result<video_upload_client>;

    private:
        uploader_config config_;
    };

    // Non-copyable, movable
    video_upload_client(const video_upload_client&) = delete;
    auto operator=(const video_upload_client&) -> video_upload_client& = delete;
    video_upload_client(video_upload_client&&) noexcept;
    auto operator=(video_upload_client&&) noexcept -> video_upload_client&;

    /**
     * @brief Cancel running uploads, stop polling and wait for tasks
     */
    ~video_upload_client();

    /**
     * @brief Start an upload of the configured file
     * @return Handle, or upload_disabled in skip mode
     */
    [[nodiscard]] auto upload() -> result<upload_handle>;

    /**
     * @brief Register a progress observer
     *
     * Observers run on the upload task, in registration order.
     */
    auto on_progress(progress_callback callback) -> subscription_id;

    auto remove_progress_observer(subscription_id id) -> bool;

    /**
     * @brief Register an observer notified once the video is playable
     */
    auto on_playable(playable_callback callback) -> subscription_id;

    auto remove_playable_observer(subscription_id id) -> bool;

    /**
     * @brief Cancel an operation by id through the registry
     */
    auto cancel(const std::string& operation_id) -> bool;

    [[nodiscard]] auto active_operations() const -> std::size_t;

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    explicit video_upload_client(uploader_config config);

    using operation_state = upload_handle::state;

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_VIDEO_UPLOAD_CLIENT_H
