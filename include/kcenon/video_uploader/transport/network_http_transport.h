/**
 * @file network_http_transport.h
 * @brief http_transport backed by network_system's HTTP client
 */

#ifndef KCENON_VIDEO_UPLOADER_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
#define KCENON_VIDEO_UPLOADER_TRANSPORT_NETWORK_HTTP_TRANSPORT_H

#include <kcenon/video_uploader/transport/http_transport.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::video_uploader {

/**
 * @brief Map a failed HTTP client call to a transport error
 * @param method HTTP method, for the message
 * @param detail Error message reported by the client
 * @return network_timeout when the client reports a timeout, network_error otherwise
 */
[[nodiscard]] auto make_transport_failure(const std::string& method,
                                          const std::string& detail) -> error;

/**
 * @brief Production transport using kcenon::network::core::http_client
 *
 * When the library is built without network_system every request fails
 * with error_code::not_available.
 *
 * The underlying client is blocking, so cancellation is observed before
 * the request is sent and after it returns. Progress is reported once,
 * when the whole body has been sent.
 */
class network_http_transport : public http_transport {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::minutes(10));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;

    [[nodiscard]] auto post(
        const http_request& request,
        const cancellation_token& token,
        const transfer_progress_callback& on_progress) -> result<http_response> override;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        const cancellation_token& token) -> result<http_response> override;

    /**
     * @brief Whether network_system support is compiled in
     */
    [[nodiscard]] static auto is_available() -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
