/**
 * @file types.h
 * @brief Core type definitions for video_uploader
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_TYPES_H
#define KCENON_VIDEO_UPLOADER_CORE_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::video_uploader {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Upload errors (-100 to -119)
    aborted = -100,
    network_error = -101,
    network_timeout = -102,
    http_error = -103,
    unknown = -104,
    invalid_response = -105,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,
    missing_credentials = -142,
    missing_video_id = -143,
    invalid_origin = -144,
    missing_file = -145,

    // File errors (-160 to -179)
    file_not_found = -160,
    file_read_error = -161,
    invalid_chunk_index = -162,

    // Auth errors (-180 to -199)
    refresh_not_available = -180,
    refresh_failed = -181,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_available = -201,
    upload_disabled = -202,
    wait_timeout = -203,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::aborted:
            return "aborted";
        case error_code::network_error:
            return "network error";
        case error_code::network_timeout:
            return "network timeout";
        case error_code::http_error:
            return "http error";
        case error_code::unknown:
            return "unknown";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::missing_video_id:
            return "'videoId' is missing";
        case error_code::invalid_origin:
            return "invalid origin";
        case error_code::missing_file:
            return "missing file";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::refresh_not_available:
            return "refresh not available";
        case error_code::refresh_failed:
            return "refresh failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_available:
            return "not available";
        case error_code::upload_disabled:
            return "upload disabled";
        case error_code::wait_timeout:
            return "wait timeout";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_upload_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value > -120;
}

[[nodiscard]] constexpr auto is_configuration_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -140 && value > -160;
}

[[nodiscard]] constexpr auto is_file_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value > -180;
}

[[nodiscard]] constexpr auto is_auth_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -180 && value > -200;
}

/**
 * @brief Error type with code, message and optional server payload
 *
 * http_status and raw_response are filled when the error originates from
 * an HTTP response. details carries the fields parsed from the error body
 * (type, title, reason, status...).
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> http_status;
    std::optional<std::string> raw_response;
    std::map<std::string, std::string> details;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Short human readable cause, used in retry log lines
     */
    [[nodiscard]] auto reason() const -> std::string {
        auto it = details.find("title");
        if (it != details.end() && !it->second.empty()) {
            return it->second;
        }
        if (http_status) {
            return "HTTP " + std::to_string(*http_status);
        }
        return message.empty() ? std::string(to_string(code)) : message;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_CORE_TYPES_H
