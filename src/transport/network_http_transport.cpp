/**
 * @file network_http_transport.cpp
 * @brief network_system HTTP client adapter implementation
 */

#include "kcenon/video_uploader/transport/network_http_transport.h"

#include "kcenon/video_uploader/config/feature_flags.h"
#include "kcenon/video_uploader/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

#include <algorithm>
#include <cctype>

namespace kcenon::video_uploader {

auto make_transport_failure(const std::string& method, const std::string& detail) -> error {
    std::string lowered = detail;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    bool timed_out = lowered.find("timeout") != std::string::npos ||
                     lowered.find("timed out") != std::string::npos;

    std::string message = "HTTP " + method + " request failed";
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return error{timed_out ? error_code::network_timeout : error_code::network_error,
                 std::move(message)};
}

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }
#endif

    static auto aborted_error() -> error {
        return error{error_code::aborted, "request aborted"};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

auto network_http_transport::is_available() -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
    return true;
#else
    return false;
#endif
}

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_transport::post(
    const http_request& request,
    const cancellation_token& token,
    const transfer_progress_callback& on_progress) -> result<http_response> {
    if (token.is_cancelled()) {
        return unexpected{impl::aborted_error()};
    }

#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->post(request.url, request.body, request.headers);

    if (token.is_cancelled()) {
        return unexpected{impl::aborted_error()};
    }

    if (response.is_err()) {
        VU_LOG_DEBUG(log_category::transport, "HTTP POST failed: " + request.url);
        return unexpected{make_transport_failure("POST", response.error().message)};
    }

    if (on_progress) {
        on_progress(request.body.size(), request.body.size());
    }
    return impl_->convert_response(response.value());
#else
    (void)request;
    (void)on_progress;
    return unexpected{error{error_code::not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_transport::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    const cancellation_token& token) -> result<http_response> {
    if (token.is_cancelled()) {
        return unexpected{impl::aborted_error()};
    }

#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->get(url, std::map<std::string, std::string>{}, headers);

    if (token.is_cancelled()) {
        return unexpected{impl::aborted_error()};
    }

    if (response.is_err()) {
        VU_LOG_DEBUG(log_category::transport, "HTTP GET failed: " + url);
        return unexpected{make_transport_failure("GET", response.error().message)};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

}  // namespace kcenon::video_uploader
