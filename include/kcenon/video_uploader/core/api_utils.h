/**
 * @file api_utils.h
 * @brief Encoding, JSON and time helpers for the video API
 *
 * Minimal helpers for the small, flat JSON documents exchanged with the
 * upload and auth endpoints. They are not a general purpose JSON library.
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_API_UTILS_H
#define KCENON_VIDEO_UPLOADER_CORE_API_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::video_uploader::api_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Base64 encode string (standard alphabet, padded)
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved characters kept)
 */
auto url_encode(const std::string& value) -> std::string;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Generate random hex string
 * @param byte_count Number of random bytes (result will be 2x this length)
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Split a JSON object into its top-level members
 * @param json JSON text
 * @return Map of member name to raw JSON value text, nullopt if the text
 *         is not a well-formed object
 *
 * Nested objects and arrays are returned unparsed and can be passed back
 * into parse_json_object() or json_array_elements().
 */
auto parse_json_object(const std::string& json)
    -> std::optional<std::map<std::string, std::string>>;

/**
 * @brief Split a JSON array into raw element texts
 */
auto json_array_elements(const std::string& json)
    -> std::optional<std::vector<std::string>>;

/**
 * @brief Decode a raw JSON string value
 * @return Unescaped string, nullopt if the value is not a JSON string
 */
auto json_string_value(const std::string& raw) -> std::optional<std::string>;

/**
 * @brief Decode a raw JSON boolean value
 */
auto json_bool_value(const std::string& raw) -> std::optional<bool>;

/**
 * @brief Look up a string member of a parsed object
 */
auto json_member_string(const std::map<std::string, std::string>& object,
                        const std::string& key) -> std::optional<std::string>;

/**
 * @brief Escape a string for embedding between JSON quotes
 */
auto json_escape(const std::string& value) -> std::string;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Parse an ISO 8601 / RFC 3339 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
 * optional "Z" or "+HH:MM" / "-HH:MM" offset. A missing offset means UTC.
 */
auto parse_iso8601_time(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point>;

}  // namespace kcenon::video_uploader::api_utils

#endif  // KCENON_VIDEO_UPLOADER_CORE_API_UTILS_H
