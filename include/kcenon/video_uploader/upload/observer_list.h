/**
 * @file observer_list.h
 * @brief Ordered observer registry used for progress and playable events
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_OBSERVER_LIST_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_OBSERVER_LIST_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace kcenon::video_uploader {

using subscription_id = uint64_t;

/**
 * @brief Thread-safe list of callbacks invoked in registration order
 *
 * emit() runs the callbacks synchronously on the calling thread over a
 * snapshot, so a callback may subscribe or unsubscribe without deadlock.
 */
template <typename Event>
class observer_list {
public:
    using callback = std::function<void(const Event&)>;

    /**
     * @brief Register a callback
     * @return Id for unsubscribe(), never 0
     */
    auto subscribe(callback cb) -> subscription_id {
        std::lock_guard lock(mutex_);
        auto id = ++last_id_;
        entries_.emplace_back(id, std::move(cb));
        return id;
    }

    /**
     * @brief Remove a callback
     * @return true if the id was registered
     */
    auto unsubscribe(subscription_id id) -> bool {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == id) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(const Event& event) const {
        std::vector<std::pair<subscription_id, callback>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = entries_;
        }
        for (const auto& [id, cb] : snapshot) {
            if (cb) {
                cb(event);
            }
        }
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return size() == 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<subscription_id, callback>> entries_;
    subscription_id last_id_ = 0;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_OBSERVER_LIST_H
