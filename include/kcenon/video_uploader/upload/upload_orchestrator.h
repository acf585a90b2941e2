/**
 * @file upload_orchestrator.h
 * @brief Sequential chunk loop for one upload operation
 */

#ifndef KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_ORCHESTRATOR_H
#define KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_ORCHESTRATOR_H

#include <kcenon/video_uploader/auth/credentials.h>
#include <kcenon/video_uploader/core/cancellation.h>
#include <kcenon/video_uploader/core/chunk_plan.h>
#include <kcenon/video_uploader/core/types.h>
#include <kcenon/video_uploader/transport/http_transport.h>
#include <kcenon/video_uploader/upload/retrier.h>
#include <kcenon/video_uploader/upload/upload_types.h>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::video_uploader {

/**
 * @brief Configuration snapshot owned by one upload operation
 */
struct upload_session {
    std::string operation_id;
    std::shared_ptr<credential_manager> credentials;
    std::shared_ptr<http_transport> transport;
    std::map<std::string, std::string> headers;
    std::optional<std::string> video_id;
    retry_strategy strategy;

    /// Backoff wait; empty uses the cancellation token's wait_for
    retrier::wait_function wait;

    std::filesystem::path file_path;
    std::string file_name;
    std::size_t chunk_size = chunk_config::default_chunk_size;
};

/**
 * @brief Drives the chunk loop of one upload
 *
 * Chunks are sent strictly in order; chunk i+1 starts only after chunk i
 * has succeeded. The video id returned by any chunk is attached to the
 * body of every following chunk. The first terminal error ends the
 * operation with status failed, or aborted after cancellation.
 */
class upload_orchestrator {
public:
    upload_orchestrator(upload_session session, progress_callback on_progress);

    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;

    /**
     * @brief Upload every chunk
     * @return Response of the last chunk or the terminal error
     */
    [[nodiscard]] auto run(const cancellation_token& token) -> result<video_upload_response>;

    [[nodiscard]] auto status() const -> upload_status;

    /**
     * @brief Video id known so far
     */
    [[nodiscard]] auto video_id() const -> std::optional<std::string>;

private:
    auto finish(upload_status status, const error& err) -> result<video_upload_response>;

    upload_session session_;
    progress_callback on_progress_;
    std::atomic<upload_status> status_{upload_status::planned};
    mutable std::mutex video_id_mutex_;
};

}  // namespace kcenon::video_uploader

#endif  // KCENON_VIDEO_UPLOADER_UPLOAD_UPLOAD_ORCHESTRATOR_H
