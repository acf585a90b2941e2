/**
 * @file credentials.h
 * @brief Credential shapes and authorization management
 */

#ifndef KCENON_VIDEO_UPLOADER_AUTH_CREDENTIALS_H
#define KCENON_VIDEO_UPLOADER_AUTH_CREDENTIALS_H

#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/types.h>
#include <kcenon/video_uploader/transport/http_transport.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace kcenon::video_uploader {

/**
 * @brief Delegated upload token
 *
 * The token is passed in the endpoint query string. A video id is
 * optional; without one the server creates the video on the first chunk.
 */
struct upload_token_credentials {
    std::string token;
    std::optional<std::string> video_id;
};

/**
 * @brief OAuth style access token with optional refresh token
 */
struct access_token_credentials {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::string video_id;
};

/**
 * @brief API key, sent as HTTP Basic authentication
 */
struct api_key_credentials {
    std::string api_key;
    std::string video_id;
};

using upload_credentials = std::variant<
    upload_token_credentials,
    access_token_credentials,
    api_key_credentials>;

/**
 * @brief Authentication mode resolved from the credential shape
 */
enum class auth_mode {
    upload_token,
    access_token,
    api_key
};

[[nodiscard]] constexpr auto to_string(auth_mode mode) -> const char* {
    switch (mode) {
        case auth_mode::upload_token: return "upload_token";
        case auth_mode::access_token: return "access_token";
        case auth_mode::api_key: return "api_key";
        default: return "unknown";
    }
}

/**
 * @brief Holds the active authorization and performs token refresh
 *
 * Shared by every upload of one uploader. The Authorization header is
 * swapped under a mutex so concurrent uploads see either the old or the
 * new value. Refreshes are serialized: an upload that got a 401 with a
 * header another upload already replaced reuses the new header instead
 * of spending the refresh token again.
 *
 * @code
 * auto manager = credential_manager::create(
 *     access_token_credentials{"token", "refresh", "vi123"}, "ws.api.video");
 * if (manager) {
 *     auto header = manager.value()->authorization_header();  // "Bearer token"
 * }
 * @endcode
 */
class credential_manager {
public:
    /**
     * @brief Validate credentials and build a manager
     * @param credentials One of the three credential shapes
     * @param api_host Host of the video API, without scheme
     * @return Manager, or missing_credentials / missing_video_id
     */
    [[nodiscard]] static auto create(const upload_credentials& credentials,
                                     const std::string& api_host)
        -> result<std::shared_ptr<credential_manager>>;

    [[nodiscard]] auto mode() const -> auth_mode;

    /**
     * @brief Current Authorization header value, nullopt for upload tokens
     */
    [[nodiscard]] auto authorization_header() const -> std::optional<std::string>;

    /**
     * @brief URL that chunks are POSTed to
     */
    [[nodiscard]] auto endpoint() const -> const std::string&;

    /**
     * @brief Video id known before the first chunk, if any
     */
    [[nodiscard]] auto initial_video_id() const -> const std::optional<std::string>&;

    /**
     * @brief Whether refresh() may be called
     *
     * True only in access-token mode with a refresh token.
     */
    [[nodiscard]] auto can_refresh() const -> bool;

    /**
     * @brief Exchange the refresh token for a new access token
     * @param transport Transport used for the POST
     * @param headers Session headers. Authorization is never forwarded.
     * @param token Cancellation token of the calling operation
     * @param rejected_authorization Authorization value that received the 401.
     *        When the current header already differs, no request is sent.
     * @return Success, refresh_not_available, refresh_failed or a transport error
     */
    [[nodiscard]] auto refresh(http_transport& transport,
                               const std::map<std::string, std::string>& headers,
                               const cancellation_token& token,
                               const std::optional<std::string>& rejected_authorization =
                                   std::nullopt) -> result<void>;

    /**
     * @brief Refresh endpoint URL
     */
    [[nodiscard]] auto refresh_endpoint() const -> std::string;

private:
    credential_manager(auth_mode mode, std::string api_host, std::string endpoint);

    auth_mode mode_;
    std::string api_host_;
    std::string endpoint_;
    std::optional<std::string> initial_video_id_;

    std::mutex refresh_mutex_;

    mutable std::mutex mutex_;
    std::optional<std::string> authorization_;
    std::optional<std::string> refresh_token_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_AUTH_CREDENTIALS_H
