/**
 * @file uploader_config.h
 * @brief Configuration collected by video_uploader::builder
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_UPLOADER_CONFIG_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_UPLOADER_CONFIG_H

#include <kcenon/video_uploader/auth/credentials.h>
#include <kcenon/video_uploader/core/chunk_config.h>
#include <kcenon/video_uploader/transport/http_transport.h>
#include <kcenon/video_uploader/upload/operation_registry.h>
#include <kcenon/video_uploader/upload/playable_poller.h>
#include <kcenon/video_uploader/upload/retrier.h>
#include <kcenon/video_uploader/upload/upload_types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::video_uploader {

/// API host used when none is configured
inline constexpr const char* default_api_host = "ws.api.video";

/**
 * @brief Uploader configuration
 */
struct uploader_config {
    std::optional<upload_credentials> credentials;

    /// Number of credential shapes passed to the builder; more than one is rejected
    std::size_t credential_count = 0;

    std::filesystem::path file_path;

    /// File name sent in the multipart body; defaults to the file's base name
    std::optional<std::string> video_name;

    std::size_t chunk_size = chunk_config::default_chunk_size;
    std::size_t max_retries = default_max_retries;

    /// Custom strategy; when empty the default strategy with max_retries is used
    retry_strategy strategy;

    std::optional<origin_info> origin_app;
    std::optional<origin_info> origin_sdk;

    std::string api_host = default_api_host;

    /// Transport; when empty a network_http_transport is created
    std::shared_ptr<http_transport> transport;

    /// Registry shared with other uploaders; when empty a private one is created
    std::shared_ptr<operation_registry> registry;

    /// Poll for playability when playable observers are registered
    bool playable_polling = true;
    std::chrono::milliseconds playable_poll_interval = playable_poller::default_interval;

    /// Build without credentials and never contact the API
    bool skip_upload = false;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_UPLOADER_CONFIG_H
