/**
 * @file request_executor.h
 * @brief Sends one authorized upload request and maps the outcome
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_REQUEST_EXECUTOR_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_REQUEST_EXECUTOR_H

#include <kcenon/video_uploader/auth/credentials.h>
#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/types.h>
#include <kcenon/video_uploader/transport/http_transport.h>
#include <kcenon/video_uploader/upload/upload_types.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Position of a chunk in the upload, sent as Content-Range
 */
struct part_info {
    uint64_t current_part = 1;            ///< 1-based
    std::optional<uint64_t> total_parts;  ///< nullopt sends "*"

    [[nodiscard]] auto header_value() const -> std::string {
        return "part " + std::to_string(current_part) + "/" +
               (total_parts ? std::to_string(*total_parts) : std::string("*"));
    }
};

/**
 * @brief Body and metadata of one upload request
 */
struct upload_request {
    std::vector<uint8_t> body;
    std::string content_type;
    std::optional<part_info> part;
};

/**
 * @brief Transport adapter for upload requests
 *
 * Each execute() call:
 * - sends the body with the session headers and current Authorization;
 * - on 401 with a refresh token, refreshes once and resubmits once;
 * - maps status < 400 to a parsed response and status >= 400 to an
 *   http_error carrying the status, raw body and parsed details.
 *
 * A second 401 after a refresh is returned as-is.
 */
class request_executor {
public:
    request_executor(std::shared_ptr<credential_manager> credentials,
                     std::shared_ptr<http_transport> transport,
                     std::map<std::string, std::string> headers);

    [[nodiscard]] auto execute(const upload_request& request,
                               const cancellation_token& token,
                               const transfer_progress_callback& on_progress) const
        -> result<video_upload_response>;

    [[nodiscard]] auto endpoint() const -> const std::string&;

    [[nodiscard]] auto headers() const -> const std::map<std::string, std::string>&;

private:
    [[nodiscard]] auto send(const upload_request& request,
                            const std::optional<std::string>& authorization,
                            const cancellation_token& token,
                            const transfer_progress_callback& on_progress) const
        -> result<http_response>;

    std::shared_ptr<credential_manager> credentials_;
    std::shared_ptr<http_transport> transport_;
    std::map<std::string, std::string> headers_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_REQUEST_EXECUTOR_H
