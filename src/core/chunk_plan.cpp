/**
 * @file chunk_plan.cpp
 * @brief Implementation of the chunk planner
 */

#include <kcenon/video_uploader/core/chunk_plan.h>

#include <algorithm>

namespace kcenon::video_uploader {

chunk_plan::chunk_plan(uint64_t file_size, chunk_config config)
    : file_size_(file_size),
      config_(config),
      count_(config_.calculate_chunk_count(file_size)) {}

auto chunk_plan::create(uint64_t file_size, std::size_t chunk_size) -> result<chunk_plan> {
    chunk_config config(chunk_size);
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }
    return chunk_plan(file_size, config);
}

auto chunk_plan::count() const -> uint64_t {
    return count_;
}

auto chunk_plan::file_size() const -> uint64_t {
    return file_size_;
}

auto chunk_plan::chunk_size() const -> std::size_t {
    return config_.chunk_size;
}

auto chunk_plan::range(uint64_t index) const -> result<chunk_range> {
    if (index >= count_) {
        return unexpected(error{error_code::invalid_chunk_index,
            "chunk index " + std::to_string(index) + " out of range (count: " +
            std::to_string(count_) + ")"});
    }

    chunk_range r;
    r.index = index;
    r.start_byte = index * config_.chunk_size;
    r.end_byte = std::min<uint64_t>((index + 1) * config_.chunk_size, file_size_);
    return r;
}

}  // namespace kcenon::video_uploader
