/**
 * @file chunk_config.h
 * @brief Chunk size bounds for video uploads
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_CHUNK_CONFIG_H
#define KCENON_VIDEO_UPLOADER_CORE_CHUNK_CONFIG_H

#include <kcenon/video_uploader/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::video_uploader {

/**
 * @brief Configuration for chunked uploads
 */
struct chunk_config {
    /// Default chunk size (50MiB)
    static constexpr std::size_t default_chunk_size = 50 * 1024 * 1024;

    /// Minimum allowed chunk size (5MiB)
    static constexpr std::size_t min_chunk_size = 5 * 1024 * 1024;

    /// Maximum allowed chunk size (128MiB)
    static constexpr std::size_t max_chunk_size = 128 * 1024 * 1024;

    std::size_t chunk_size = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     *
     * Both bounds are inclusive.
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     * @return ceil(file_size / chunk_size), at least 1
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 1;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_CORE_CHUNK_CONFIG_H
