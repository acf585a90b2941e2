/**
 * @file operation_registry.cpp
 * @brief Operation registry implementation
 */

#include "kcenon/video_uploader/upload/operation_registry.h"

#include "kcenon/video_uploader/core/api_utils.h"

#include <mutex>

namespace kcenon::video_uploader {

auto operation_registry::generate_id() -> std::string {
    return api_utils::generate_random_hex(8);
}

auto operation_registry::insert(const std::string& id, cancellation_source source) -> bool {
    std::unique_lock lock(mutex_);
    return operations_.emplace(id, std::move(source)).second;
}

auto operation_registry::cancel(const std::string& id) -> bool {
    cancellation_source source;
    {
        std::shared_lock lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end()) {
            return false;
        }
        source = it->second;
    }
    source.cancel();
    return true;
}

auto operation_registry::cancel_all() -> std::size_t {
    std::vector<cancellation_source> sources;
    {
        std::shared_lock lock(mutex_);
        sources.reserve(operations_.size());
        for (const auto& [id, source] : operations_) {
            sources.push_back(source);
        }
    }
    for (auto& source : sources) {
        source.cancel();
    }
    return sources.size();
}

auto operation_registry::remove(const std::string& id) -> bool {
    std::unique_lock lock(mutex_);
    return operations_.erase(id) > 0;
}

auto operation_registry::contains(const std::string& id) const -> bool {
    std::shared_lock lock(mutex_);
    return operations_.find(id) != operations_.end();
}

auto operation_registry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return operations_.size();
}

auto operation_registry::ids() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(operations_.size());
    for (const auto& [id, source] : operations_) {
        result.push_back(id);
    }
    return result;
}

}  // namespace kcenon::video_uploader
