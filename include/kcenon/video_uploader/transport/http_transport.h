/**
 * @file http_transport.h
 * @brief HTTP transport abstraction used by the uploader
 */

#ifndef KCENON_VIDEO_UPLOADER_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_VIDEO_UPLOADER_TRANSPORT_HTTP_TRANSPORT_H

#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Progress callback for request bodies
 * @param loaded Bytes of the body sent so far
 * @param total Total body bytes
 */
using transfer_progress_callback = std::function<void(uint64_t loaded, uint64_t total)>;

/**
 * @brief Outgoing HTTP request
 */
struct http_request {
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
};

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        for (const auto& [k, v] : headers) {
            std::string lower_k = k;
            std::transform(lower_k.begin(), lower_k.end(), lower_k.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (lower_k == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return status_code >= 400;
    }
};

/**
 * @brief Abstract HTTP transport
 *
 * Implementations return a response for every status code. Only failures
 * below HTTP are reported as errors:
 * - error_code::network_error   connection or protocol failure
 * - error_code::network_timeout no response in time
 * - error_code::aborted         the cancellation token fired
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Send a POST request
     * @param request URL, headers and body
     * @param token Cancellation token of the owning operation
     * @param on_progress Optional body progress callback
     */
    [[nodiscard]] virtual auto post(
        const http_request& request,
        const cancellation_token& token,
        const transfer_progress_callback& on_progress) -> result<http_response> = 0;

    /**
     * @brief Send a GET request
     */
    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        const cancellation_token& token) -> result<http_response> = 0;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_TRANSPORT_HTTP_TRANSPORT_H
