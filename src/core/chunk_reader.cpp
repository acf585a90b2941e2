/**
 * @file chunk_reader.cpp
 * @brief Implementation of chunk byte-range reading
 */

#include <kcenon/video_uploader/core/chunk_reader.h>

namespace kcenon::video_uploader {

chunk_reader::chunk_reader(std::filesystem::path path, std::ifstream file, uint64_t file_size)
    : path_(std::move(path)), file_(std::move(file)), file_size_(file_size) {}

auto chunk_reader::open(const std::filesystem::path& file_path) -> result<chunk_reader> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + file_path.string()});
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + file_path.string()});
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + file_path.string()});
    }

    return chunk_reader(file_path, std::move(file), file_size);
}

auto chunk_reader::read(const chunk_range& range) -> result<std::vector<std::byte>> {
    if (range.end_byte < range.start_byte || range.end_byte > file_size_) {
        return unexpected(error{error_code::invalid_chunk_index,
            "range exceeds file size: " + std::to_string(range.end_byte)});
    }

    std::vector<std::byte> buffer(static_cast<std::size_t>(range.size()));
    if (buffer.empty()) {
        return buffer;
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(range.start_byte), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto bytes_read = static_cast<std::size_t>(file_.gcount());

    if (bytes_read != buffer.size()) {
        return unexpected(
            error{error_code::file_read_error, "failed to read expected bytes"});
    }

    return buffer;
}

auto chunk_reader::file_size() const -> uint64_t {
    return file_size_;
}

auto chunk_reader::path() const -> const std::filesystem::path& {
    return path_;
}

}  // namespace kcenon::video_uploader
