/**
 * @file chunk_plan.h
 * @brief Byte-range plan for a chunked upload
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_CHUNK_PLAN_H
#define KCENON_VIDEO_UPLOADER_CORE_CHUNK_PLAN_H

#include <kcenon/video_uploader/core/chunk_config.h>
#include <kcenon/video_uploader/core/types.h>

#include <cstdint>

namespace kcenon::video_uploader {

/**
 * @brief One contiguous byte range [start_byte, end_byte) of the source file
 */
struct chunk_range {
    uint64_t index = 0;
    uint64_t start_byte = 0;
    uint64_t end_byte = 0;

    [[nodiscard]] auto size() const -> uint64_t { return end_byte - start_byte; }

    [[nodiscard]] auto operator==(const chunk_range& other) const -> bool = default;
};

/**
 * @brief Computes chunk count and ranges for a file
 *
 * Ranges are derived on demand and never stored. A zero-byte file has a
 * single empty chunk so that the server still receives one request.
 */
class chunk_plan {
public:
    /**
     * @brief Create a plan
     * @param file_size Size of the file in bytes
     * @param chunk_size Chunk size, must lie within chunk_config bounds
     * @return Plan or invalid_chunk_size error
     */
    [[nodiscard]] static auto create(uint64_t file_size, std::size_t chunk_size)
        -> result<chunk_plan>;

    [[nodiscard]] auto count() const -> uint64_t;

    [[nodiscard]] auto file_size() const -> uint64_t;

    [[nodiscard]] auto chunk_size() const -> std::size_t;

    /**
     * @brief Byte range of a chunk
     * @param index 0-based ordinal in [0, count())
     */
    [[nodiscard]] auto range(uint64_t index) const -> result<chunk_range>;

private:
    chunk_plan(uint64_t file_size, chunk_config config);

    uint64_t file_size_;
    chunk_config config_;
    uint64_t count_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_CORE_CHUNK_PLAN_H
