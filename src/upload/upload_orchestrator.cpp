/**
 * @file upload_orchestrator.cpp
 * @brief Chunk loop implementation
 */

#include "kcenon/video_uploader/upload/upload_orchestrator.h"

#include "kcenon/video_uploader/core/chunk_reader.h"
#include "kcenon/video_uploader/core/logging.h"
#include "kcenon/video_uploader/transport/multipart_form.h"
#include "kcenon/video_uploader/upload/request_executor.h"

#include <algorithm>

namespace kcenon::video_uploader {

upload_orchestrator::upload_orchestrator(upload_session session, progress_callback on_progress)
    : session_(std::move(session)), on_progress_(std::move(on_progress)) {}

auto upload_orchestrator::status() const -> upload_status {
    return status_.load();
}

auto upload_orchestrator::video_id() const -> std::optional<std::string> {
    std::lock_guard lock(video_id_mutex_);
    return session_.video_id;
}

auto upload_orchestrator::finish(upload_status status, const error& err)
    -> result<video_upload_response> {
    status_.store(status);

    upload_log_context ctx;
    ctx.operation_id = session_.operation_id;
    ctx.filename = session_.file_path.string();
    ctx.error_message = err.message;
    ctx.http_status = err.http_status;

    if (status == upload_status::aborted) {
        VU_LOG_INFO_CTX(log_category::uploader, "upload aborted", ctx);
    } else {
        VU_LOG_ERROR_CTX(log_category::uploader, "upload failed", ctx);
    }
    return unexpected(err);
}

auto upload_orchestrator::run(const cancellation_token& token) -> result<video_upload_response> {
    status_.store(upload_status::uploading);

    auto reader = chunk_reader::open(session_.file_path);
    if (!reader) {
        return finish(upload_status::failed, reader.error());
    }

    auto plan = chunk_plan::create(reader.value().file_size(), session_.chunk_size);
    if (!plan) {
        return finish(upload_status::failed, plan.error());
    }

    const auto total_chunks = plan.value().count();
    const auto file_size = plan.value().file_size();

    retrier upload_retrier = session_.wait
        ? retrier(session_.strategy, session_.wait)
        : retrier(session_.strategy);
    request_executor executor(session_.credentials, session_.transport, session_.headers);

    upload_log_context start_ctx;
    start_ctx.operation_id = session_.operation_id;
    start_ctx.filename = session_.file_path.string();
    start_ctx.file_size = file_size;
    start_ctx.total_chunks = static_cast<uint32_t>(total_chunks);
    start_ctx.endpoint = executor.endpoint();
    VU_LOG_INFO_CTX(log_category::uploader, "upload started", start_ctx);

    std::optional<video_upload_response> last_response;

    for (uint64_t index = 0; index < total_chunks; ++index) {
        if (token.is_cancelled()) {
            return finish(upload_status::aborted, error{error_code::aborted, "upload aborted"});
        }

        auto range = plan.value().range(index);
        if (!range) {
            return finish(upload_status::failed, range.error());
        }
        const auto chunk = range.value();

        auto data = reader.value().read(chunk);
        if (!data) {
            return finish(upload_status::failed, data.error());
        }

        multipart_form form;
        if (auto current_id = video_id()) {
            form.add_field("videoId", *current_id);
        }
        form.add_file("file", session_.file_name, data.value());

        upload_request request;
        request.body = form.build();
        request.content_type = form.content_type();
        request.part = part_info{index + 1, total_chunks};

        const auto chunk_size_bytes = static_cast<uint64_t>(session_.chunk_size);
        auto on_transfer_progress = [&, chunk](uint64_t loaded, uint64_t /*total*/) {
            if (!on_progress_) {
                return;
            }
            auto chunk_loaded = std::min<uint64_t>(loaded, chunk.size());

            upload_progress_event event;
            event.uploaded_bytes = chunk.start_byte + chunk_loaded;
            event.total_bytes = file_size;
            event.chunks_count = total_chunks;
            event.chunk_size_bytes = chunk_size_bytes;
            event.current_chunk = chunk.index + 1;
            event.current_chunk_uploaded_bytes = chunk_loaded;
            on_progress_(event);
        };

        retry_state state;
        auto response = upload_retrier.run<video_upload_response>(
            [&](const cancellation_token& t) {
                return executor.execute(request, t, on_transfer_progress);
            },
            token, &state);

        if (!response) {
            auto status = response.error().code == error_code::aborted
                ? upload_status::aborted
                : upload_status::failed;
            return finish(status, response.error());
        }

        if (!response.value().video_id.empty()) {
            std::lock_guard lock(video_id_mutex_);
            session_.video_id = response.value().video_id;
        }

        upload_log_context ctx;
        ctx.operation_id = session_.operation_id;
        ctx.video_id = video_id();
        ctx.chunk_index = static_cast<uint32_t>(index + 1);
        ctx.total_chunks = static_cast<uint32_t>(total_chunks);
        ctx.bytes_uploaded = chunk.end_byte;
        ctx.attempt = static_cast<uint32_t>(state.attempts);
        VU_LOG_DEBUG_CTX(log_category::uploader, "chunk uploaded", ctx);

        last_response = std::move(response.value());
    }

    status_.store(upload_status::done);

    upload_log_context done_ctx;
    done_ctx.operation_id = session_.operation_id;
    done_ctx.video_id = video_id();
    done_ctx.file_size = file_size;
    VU_LOG_INFO_CTX(log_category::uploader, "upload completed", done_ctx);

    return std::move(*last_response);
}

}  // namespace kcenon::video_uploader
