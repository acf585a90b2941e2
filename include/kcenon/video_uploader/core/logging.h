// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/video_uploader/config/feature_flags.h"

#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::video_uploader {

/**
 * @brief Log categories for the uploader
 */
struct log_category {
    static constexpr std::string_view uploader = "video_uploader.uploader";
    static constexpr std::string_view retrier = "video_uploader.retrier";
    static constexpr std::string_view transport = "video_uploader.transport";
    static constexpr std::string_view auth = "video_uploader.auth";
    static constexpr std::string_view poller = "video_uploader.poller";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Credentials are masked by default. Paths are only masked on request.
 */
struct masking_config {
    bool mask_credentials = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks tokens, API keys and file paths in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_credentials && !config_.mask_paths) {
            return input;
        }

        std::string result = input;

        if (config_.mask_credentials) {
            result = mask_credential_values(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a secret, keeping the first visible_chars characters
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (!config_.mask_credentials || secret.empty()) {
            return secret;
        }
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_credential_values(const std::string& input) const -> std::string {
        // token=<value> in query strings, Bearer/Basic <value> in headers
        static const std::regex credential_pattern(
            R"(((?:token=)|(?:Bearer )|(?:Basic ))([A-Za-z0-9._~+/=-]+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), credential_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, match.position() - last_pos);
            result += match[1].str();
            result += mask_secret(match[2].str());
            last_pos = match.position() + match.length();
        }
        result += input.substr(last_pos);
        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+){2,}))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            auto path_pos = static_cast<size_t>(match.position(1));
            result += input.substr(last_pos, path_pos - last_pos);
            result += mask_path(match[1].str());
            last_pos = path_pos + match[1].length();
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_log_json(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);

    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string operation_id;
    std::string filename;
    std::optional<std::string> video_id;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_uploaded;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> retry_delay_ms;
    std::optional<int> http_status;
    std::optional<std::string> error_message;
    std::optional<std::string> endpoint;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        bool first = true;

        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_log_json(value) << "\"";
            first = false;
        };

        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        auto masked = [&](const std::string& value) {
            return masker ? masker->mask(value) : value;
        };

        if (!operation_id.empty()) add_field("operation_id", operation_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (video_id) add_field("video_id", *video_id);
        if (file_size) add_int("size", static_cast<int64_t>(*file_size));
        if (bytes_uploaded) add_int("bytes_uploaded", static_cast<int64_t>(*bytes_uploaded));
        if (chunk_index) add_int("chunk_index", *chunk_index);
        if (total_chunks) add_int("total_chunks", *total_chunks);
        if (attempt) add_int("attempt", *attempt);
        if (retry_delay_ms) add_int("retry_delay_ms", static_cast<int64_t>(*retry_delay_ms));
        if (http_status) add_int("http_status", *http_status);
        if (error_message) add_field("error_message", masked(*error_message));
        if (endpoint) add_field("endpoint", masked(*endpoint));

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_log_json(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_log_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Uploader logging interface
 *
 * Routes to a kcenon logger when logger_system is built in, otherwise to
 * stderr. A callback can observe every message regardless of backend.
 */
class uploader_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const upload_log_context*)>;

    uploader_logger() = default;
    ~uploader_logger() = default;

    uploader_logger(const uploader_logger&) = delete;
    uploader_logger& operator=(const uploader_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when an uploader is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set a callback observing every emitted message
     *
     * The callback receives the message after masking.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked_message = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        std::string line_out;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            line_out = entry.to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked_message;
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            line_out = oss.str();
        }

#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_out, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_out);
            }
        }
#else
        if (format == log_output_format::json) {
            output_to_stderr(line_out);
        } else {
            output_to_stderr(get_timestamp() + " [" +
                             std::string(log_level_to_string(level)) + "] " + line_out);
        }
#endif
    }

    void flush() {
#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if VIDEO_UPLOADER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline uploader_logger& get_logger() {
    static uploader_logger instance;
    return instance;
}

#define VU_LOG(level, category, message) \
    kcenon::video_uploader::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define VU_LOG_CTX(level, category, message, context) \
    kcenon::video_uploader::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define VU_LOG_TRACE(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::trace, category, message)
#define VU_LOG_DEBUG(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::debug, category, message)
#define VU_LOG_INFO(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::info, category, message)
#define VU_LOG_WARN(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::warn, category, message)
#define VU_LOG_ERROR(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::error, category, message)
#define VU_LOG_FATAL(category, message) \
    VU_LOG(kcenon::video_uploader::log_level::fatal, category, message)

#define VU_LOG_TRACE_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::trace, category, message, ctx)
#define VU_LOG_DEBUG_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::debug, category, message, ctx)
#define VU_LOG_INFO_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::info, category, message, ctx)
#define VU_LOG_WARN_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::warn, category, message, ctx)
#define VU_LOG_ERROR_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::error, category, message, ctx)
#define VU_LOG_FATAL_CTX(category, message, ctx) \
    VU_LOG_CTX(kcenon::video_uploader::log_level::fatal, category, message, ctx)

}  // namespace kcenon::video_uploader
