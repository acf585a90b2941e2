/**
 * @file chunk_reader.h
 * @brief Reads planned byte ranges from the source file
 */

#ifndef KCENON_VIDEO_UPLOADER_CORE_CHUNK_READER_H
#define KCENON_VIDEO_UPLOADER_CORE_CHUNK_READER_H

#include <kcenon/video_uploader/core/chunk_plan.h>
#include <kcenon/video_uploader/core/types.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Random-access reader for chunk byte ranges
 *
 * Holds the file open for the lifetime of one upload operation. Only one
 * chunk is held in memory at a time.
 */
class chunk_reader {
public:
    /**
     * @brief Open a file for reading
     * @return Reader or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& file_path)
        -> result<chunk_reader>;

    /**
     * @brief Read one byte range
     */
    [[nodiscard]] auto read(const chunk_range& range) -> result<std::vector<std::byte>>;

    [[nodiscard]] auto file_size() const -> uint64_t;

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

    chunk_reader(chunk_reader&&) noexcept = default;
    auto operator=(chunk_reader&&) noexcept -> chunk_reader& = default;

    chunk_reader(const chunk_reader&) = delete;
    auto operator=(const chunk_reader&) -> chunk_reader& = delete;

private:
    chunk_reader(std::filesystem::path path, std::ifstream file, uint64_t file_size);

    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t file_size_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_CORE_CHUNK_READER_H
