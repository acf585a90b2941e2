/**
 * @file credentials.cpp
 * @brief Credential manager implementation
 */

#include "kcenon/video_uploader/auth/credentials.h"

#include "kcenon/video_uploader/core/api_utils.h"
#include "kcenon/video_uploader/core/logging.h"
#include "kcenon/video_uploader/upload/response_mapper.h"

namespace kcenon::video_uploader {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto video_source_endpoint(const std::string& host, const std::string& video_id) -> std::string {
    return "https://" + host + "/videos/" + api_utils::url_encode(video_id) + "/source";
}

}  // namespace

credential_manager::credential_manager(auth_mode mode, std::string api_host, std::string endpoint)
    : mode_(mode), api_host_(std::move(api_host)), endpoint_(std::move(endpoint)) {}

auto credential_manager::create(const upload_credentials& credentials,
                                const std::string& api_host)
    -> result<std::shared_ptr<credential_manager>> {
    if (api_host.empty()) {
        return unexpected(error{error_code::invalid_configuration, "api host is empty"});
    }

    return std::visit(overloaded{
        [&](const upload_token_credentials& c) -> result<std::shared_ptr<credential_manager>> {
            if (c.token.empty()) {
                return unexpected(error{error_code::missing_credentials, "upload token is empty"});
            }
            std::shared_ptr<credential_manager> manager(new credential_manager(
                auth_mode::upload_token, api_host,
                "https://" + api_host + "/upload?token=" + api_utils::url_encode(c.token)));
            if (c.video_id && !c.video_id->empty()) {
                manager->initial_video_id_ = c.video_id;
            }
            return manager;
        },
        [&](const access_token_credentials& c) -> result<std::shared_ptr<credential_manager>> {
            if (c.access_token.empty()) {
                return unexpected(error{error_code::missing_credentials, "access token is empty"});
            }
            if (c.video_id.empty()) {
                return unexpected(error{error_code::missing_video_id});
            }
            std::shared_ptr<credential_manager> manager(new credential_manager(
                auth_mode::access_token, api_host, video_source_endpoint(api_host, c.video_id)));
            manager->initial_video_id_ = c.video_id;
            manager->authorization_ = "Bearer " + c.access_token;
            if (c.refresh_token && !c.refresh_token->empty()) {
                manager->refresh_token_ = c.refresh_token;
            }
            return manager;
        },
        [&](const api_key_credentials& c) -> result<std::shared_ptr<credential_manager>> {
            if (c.api_key.empty()) {
                return unexpected(error{error_code::missing_credentials, "api key is empty"});
            }
            if (c.video_id.empty()) {
                return unexpected(error{error_code::missing_video_id});
            }
            std::shared_ptr<credential_manager> manager(new credential_manager(
                auth_mode::api_key, api_host, video_source_endpoint(api_host, c.video_id)));
            manager->initial_video_id_ = c.video_id;
            manager->authorization_ = "Basic " + api_utils::base64_encode(c.api_key + ":");
            return manager;
        }
    }, credentials);
}

auto credential_manager::mode() const -> auth_mode {
    return mode_;
}

auto credential_manager::authorization_header() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return authorization_;
}

auto credential_manager::endpoint() const -> const std::string& {
    return endpoint_;
}

auto credential_manager::initial_video_id() const -> const std::optional<std::string>& {
    return initial_video_id_;
}

auto credential_manager::can_refresh() const -> bool {
    if (mode_ != auth_mode::access_token) {
        return false;
    }
    std::lock_guard lock(mutex_);
    return refresh_token_.has_value();
}

auto credential_manager::refresh_endpoint() const -> std::string {
    return "https://" + api_host_ + "/auth/refresh";
}

auto credential_manager::refresh(http_transport& transport,
                                 const std::map<std::string, std::string>& headers,
                                 const cancellation_token& token,
                                 const std::optional<std::string>& rejected_authorization)
    -> result<void> {
    std::lock_guard refresh_lock(refresh_mutex_);

    std::optional<std::string> current_refresh_token;
    {
        std::lock_guard lock(mutex_);
        if (rejected_authorization && authorization_ != rejected_authorization) {
            VU_LOG_DEBUG(log_category::auth, "access token already refreshed by another upload");
            return {};
        }
        current_refresh_token = refresh_token_;
    }

    if (mode_ != auth_mode::access_token || !current_refresh_token) {
        return unexpected(error{error_code::refresh_not_available,
            std::string("refresh is not available in ") + to_string(mode_) + " mode"});
    }

    http_request request;
    request.url = refresh_endpoint();
    for (const auto& [name, value] : headers) {
        if (name != "Authorization") {
            request.headers[name] = value;
        }
    }
    request.headers["Content-Type"] = "application/json";

    std::string body = "{\"refreshToken\":\"" + api_utils::json_escape(*current_refresh_token) + "\"}";
    request.body.assign(body.begin(), body.end());

    VU_LOG_DEBUG(log_category::auth, "refreshing access token");

    auto response = transport.post(request, token, nullptr);
    if (!response) {
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    if (resp.is_error()) {
        auto err = parse_error_response(resp, error_code::refresh_failed);
        upload_log_context ctx;
        ctx.http_status = resp.status_code;
        ctx.endpoint = request.url;
        VU_LOG_WARN_CTX(log_category::auth, "access token refresh rejected", ctx);
        return unexpected(std::move(err));
    }

    auto object = api_utils::parse_json_object(resp.get_body_string());
    auto access_token = object ? api_utils::json_member_string(*object, "access_token")
                               : std::nullopt;
    if (!access_token || access_token->empty()) {
        error err(error_code::refresh_failed, "refresh response has no access_token");
        err.http_status = resp.status_code;
        err.raw_response = resp.get_body_string();
        return unexpected(std::move(err));
    }
    auto new_refresh_token = api_utils::json_member_string(*object, "refresh_token");

    {
        std::lock_guard lock(mutex_);
        authorization_ = "Bearer " + *access_token;
        if (new_refresh_token && !new_refresh_token->empty()) {
            refresh_token_ = new_refresh_token;
        }
    }

    VU_LOG_INFO(log_category::auth, "access token refreshed");
    return {};
}

}  // namespace kcenon::video_uploader
