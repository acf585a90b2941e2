/**
 * @file video_uploader.h
 * @brief Main header for the video_uploader library
 * @version 0.1.0
 *
 * Include this header to access all upload functionality.
 *
 * @code
 * #include <kcenon/video_uploader/video_uploader.h>
 *
 * using namespace kcenon::video_uploader;
 *
 * auto client = video_upload_client::builder()
 *     .with_api_key("api-key", "vi4blUQJFrYWbaG44NChkH27")
 *     .with_file("movie.mp4")
 *     .build();
 * @endcode
 */

#ifndef KCENON_VIDEO_UPLOADER_VIDEO_UPLOADER_H
#define KCENON_VIDEO_UPLOADER_VIDEO_UPLOADER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/video_uploader/core/types.h"
#include "kcenon/video_uploader/core/chunk_plan.h"

// Authentication
#include "kcenon/video_uploader/auth/credentials.h"

// Transport
#include "kcenon/video_uploader/transport/http_transport.h"
#include "kcenon/video_uploader/transport/network_http_transport.h"

// Upload
#include "kcenon/video_uploader/upload/upload_types.h"
#include "kcenon/video_uploader/upload/retrier.h"
#include "kcenon/video_uploader/upload/video_upload_client.h"

namespace kcenon::video_uploader {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

/// Client name sent in the AV-Origin-Client header
inline constexpr const char* origin_client_name = "cpp-video-uploader";

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_VIDEO_UPLOADER_H
