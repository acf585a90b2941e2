/**
 * @file upload_types.h
 * @brief Public data types for video uploads
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_TYPES_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_TYPES_H

#include <kcenon/video_uploader/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Upload operation state
 */
enum class upload_status {
    planned,    ///< Handle created, no chunk sent yet
    uploading,  ///< Chunk loop running
    done,       ///< Final chunk accepted
    aborted,    ///< Cancelled by the caller
    failed      ///< Terminal error on some chunk
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> const char* {
    switch (status) {
        case upload_status::planned: return "planned";
        case upload_status::uploading: return "uploading";
        case upload_status::done: return "done";
        case upload_status::aborted: return "aborted";
        case upload_status::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(upload_status status) -> bool {
    return status == upload_status::done ||
           status == upload_status::aborted ||
           status == upload_status::failed;
}

/**
 * @brief Custom metadata entry attached to a video
 */
struct video_metadata_entry {
    std::string key;
    std::string value;

    [[nodiscard]] auto operator==(const video_metadata_entry& other) const -> bool = default;
};

/**
 * @brief Source of the uploaded video
 */
struct video_source {
    std::string type;
    std::string uri;
};

/**
 * @brief Asset URLs derived by the server
 */
struct video_assets {
    std::optional<std::string> iframe;
    std::optional<std::string> player;
    std::optional<std::string> hls;
    std::optional<std::string> thumbnail;
    std::optional<std::string> mp4;
};

/**
 * @brief Video record returned by the upload endpoint
 *
 * The JSON "public" flag is exposed as is_public.
 */
struct video_upload_response {
    std::string video_id;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<bool> is_public;
    std::optional<bool> panoramic;
    std::optional<bool> mp4_support;
    std::optional<std::chrono::system_clock::time_point> published_at;
    std::optional<std::chrono::system_clock::time_point> created_at;
    std::optional<std::chrono::system_clock::time_point> updated_at;
    std::vector<std::string> tags;
    std::vector<video_metadata_entry> metadata;
    std::optional<video_source> source;
    video_assets assets;

    /// Unmodified response body
    std::string raw;
};

/**
 * @brief Progress snapshot emitted during an upload
 */
struct upload_progress_event {
    uint64_t uploaded_bytes = 0;
    uint64_t total_bytes = 0;
    uint64_t chunks_count = 0;
    uint64_t chunk_size_bytes = 0;
    uint64_t current_chunk = 0;  ///< 1-based
    uint64_t current_chunk_uploaded_bytes = 0;

    [[nodiscard]] auto completion_percentage() const -> double {
        if (total_bytes == 0) {
            // Zero-byte file: complete once its only chunk has been sent
            return (chunks_count > 0 && current_chunk == chunks_count) ? 100.0 : 0.0;
        }
        return static_cast<double>(uploaded_bytes) / static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Identification of the calling application or SDK
 *
 * Sent as "name:version" in the AV-Origin-App / AV-Origin-Sdk headers.
 */
struct origin_info {
    std::string name;
    std::string version;

    /**
     * @brief Validate name and version
     *
     * name: 1 to 50 of [A-Za-z0-9_-]. version: 1 to 3 dot separated
     * groups of 1 to 3 digits.
     */
    [[nodiscard]] auto validate(const std::string& label) const -> result<void>;

    [[nodiscard]] auto header_value() const -> std::string {
        return name + ":" + version;
    }
};

using progress_callback = std::function<void(const upload_progress_event&)>;
using playable_callback = std::function<void(const video_upload_response&)>;

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_TYPES_H
