/**
 * @file request_executor.cpp
 * @brief Upload request execution with 401 refresh handling
 */

#include "kcenon/video_uploader/upload/request_executor.h"

#include "kcenon/video_uploader/core/logging.h"
#include "kcenon/video_uploader/upload/response_mapper.h"

namespace kcenon::video_uploader {

namespace {
constexpr int http_unauthorized = 401;
}  // namespace

request_executor::request_executor(std::shared_ptr<credential_manager> credentials,
                                   std::shared_ptr<http_transport> transport,
                                   std::map<std::string, std::string> headers)
    : credentials_(std::move(credentials)),
      transport_(std::move(transport)),
      headers_(std::move(headers)) {}

auto request_executor::endpoint() const -> const std::string& {
    return credentials_->endpoint();
}

auto request_executor::headers() const -> const std::map<std::string, std::string>& {
    return headers_;
}

auto request_executor::send(const upload_request& request,
                            const std::optional<std::string>& authorization,
                            const cancellation_token& token,
                            const transfer_progress_callback& on_progress) const
    -> result<http_response> {
    http_request http;
    http.url = credentials_->endpoint();
    http.headers = headers_;
    if (!request.content_type.empty()) {
        http.headers["Content-Type"] = request.content_type;
    }
    if (request.part) {
        http.headers["Content-Range"] = request.part->header_value();
    }
    if (authorization) {
        http.headers["Authorization"] = *authorization;
    }
    http.body = request.body;

    return transport_->post(http, token, on_progress);
}

auto request_executor::execute(const upload_request& request,
                               const cancellation_token& token,
                               const transfer_progress_callback& on_progress) const
    -> result<video_upload_response> {
    auto authorization = credentials_->authorization_header();
    auto response = send(request, authorization, token, on_progress);
    if (!response) {
        return unexpected(response.error());
    }

    if (response.value().status_code == http_unauthorized && credentials_->can_refresh()) {
        VU_LOG_INFO(log_category::transport, "received 401, refreshing access token");

        auto refreshed = credentials_->refresh(*transport_, headers_, token, authorization);
        if (!refreshed) {
            return unexpected(refreshed.error());
        }

        response = send(request, credentials_->authorization_header(), token, on_progress);
        if (!response) {
            return unexpected(response.error());
        }
    }

    const auto& resp = response.value();
    if (resp.is_error()) {
        auto err = parse_error_response(resp);

        upload_log_context ctx;
        ctx.http_status = resp.status_code;
        ctx.endpoint = credentials_->endpoint();
        ctx.error_message = err.message;
        VU_LOG_DEBUG_CTX(log_category::transport, "upload request rejected", ctx);

        return unexpected(std::move(err));
    }

    auto parsed = parse_upload_response(resp.get_body_string());
    if (!parsed) {
        auto err = parsed.error();
        err.http_status = resp.status_code;
        err.raw_response = resp.get_body_string();

        upload_log_context ctx;
        ctx.http_status = resp.status_code;
        ctx.endpoint = credentials_->endpoint();
        ctx.error_message = err.message;
        VU_LOG_WARN_CTX(log_category::transport, "chunk accepted with unreadable response", ctx);

        return unexpected(std::move(err));
    }
    return parsed;
}

}  // namespace kcenon::video_uploader
