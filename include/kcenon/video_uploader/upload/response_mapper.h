/**
 * @file response_mapper.h
 * @brief Maps HTTP response bodies to upload responses and errors
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_RESPONSE_MAPPER_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_RESPONSE_MAPPER_H

#include <kcenon/video_uploader/core/types.h>
#include <kcenon/video_uploader/transport/http_transport.h>
#include <kcenon/video_uploader/upload/upload_types.h>

#include <string>

namespace kcenon::video_uploader {

/**
 * @brief Parse a successful upload response body
 * @return Mapped response, or error_code::invalid_response if the body is not
 *         a JSON object carrying a videoId
 */
[[nodiscard]] auto parse_upload_response(const std::string& body)
    -> result<video_upload_response>;

/**
 * @brief Build the error for a response with status >= 400
 *
 * The body is parsed opportunistically. When it is not a JSON object the
 * details fall back to {status, raw, reason: "UNKNOWN"}.
 *
 * @param response Failed HTTP response
 * @param code Error code to report (http_error for uploads)
 */
[[nodiscard]] auto parse_error_response(const http_response& response,
                                        error_code code = error_code::http_error) -> error;

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_RESPONSE_MAPPER_H
