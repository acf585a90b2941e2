/**
 * @file operation_registry.h
 * @brief Maps upload operation ids to their cancellation handles
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_OPERATION_REGISTRY_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_OPERATION_REGISTRY_H

#include <kcenon/video_uploader/core/cancellation.h>

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::video_uploader {

/**
 * @brief Concurrency-safe registry of active upload operations
 *
 * Entries are added when an upload starts and removed when it settles.
 * The registry only routes cancel() calls; it never owns upload state.
 */
class operation_registry {
public:
    /**
     * @brief Generate a fresh random operation id
     */
    [[nodiscard]] static auto generate_id() -> std::string;

    /**
     * @brief Register an operation
     * @return false if the id is already present
     */
    auto insert(const std::string& id, cancellation_source source) -> bool;

    /**
     * @brief Cancel an operation
     * @return true if the id was registered
     */
    auto cancel(const std::string& id) -> bool;

    /**
     * @brief Cancel every registered operation
     * @return Number of operations signalled
     */
    auto cancel_all() -> std::size_t;

    auto remove(const std::string& id) -> bool;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto ids() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, cancellation_source> operations_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_OPERATION_REGISTRY_H
