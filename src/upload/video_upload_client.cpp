/**
 * @file video_upload_client.cpp
 * @brief Implementation of the video upload client
 */

#include "kcenon/video_uploader/upload/video_upload_client.h"

#include "kcenon/video_uploader/core/logging.h"
#include "kcenon/video_uploader/transport/network_http_transport.h"
#include "kcenon/video_uploader/upload/upload_orchestrator.h"
#include "kcenon/video_uploader/video_uploader.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <vector>

namespace kcenon::video_uploader {

// ============================================================================
// upload_handle
// ============================================================================

struct upload_handle::state {
    std::string id;
    cancellation_source source;
    std::shared_ptr<upload_orchestrator> orchestrator;
    std::shared_future<result<video_upload_response>> outcome;
    std::atomic<bool> settled{false};
};

upload_handle::upload_handle(std::shared_ptr<state> s) : state_(std::move(s)) {}

auto upload_handle::id() const -> const std::string& {
    static const std::string empty;
    return state_ ? state_->id : empty;
}

auto upload_handle::is_valid() const noexcept -> bool {
    return state_ != nullptr;
}

auto upload_handle::cancel() -> bool {
    if (!state_ || state_->settled.load()) {
        return false;
    }
    return state_->source.cancel();
}

auto upload_handle::wait() const -> result<video_upload_response> {
    if (!state_) {
        return unexpected(error{error_code::internal_error, "invalid upload handle"});
    }
    return state_->outcome.get();
}

auto upload_handle::wait_for(std::chrono::milliseconds timeout) const
    -> result<video_upload_response> {
    if (!state_) {
        return unexpected(error{error_code::internal_error, "invalid upload handle"});
    }
    if (state_->outcome.wait_for(timeout) != std::future_status::ready) {
        return unexpected(error{error_code::wait_timeout,
            "upload did not settle within " + std::to_string(timeout.count()) + " ms"});
    }
    return state_->outcome.get();
}

auto upload_handle::status() const -> upload_status {
    if (!state_) {
        return upload_status::failed;
    }
    return state_->orchestrator->status();
}

auto upload_handle::video_id() const -> std::optional<std::string> {
    if (!state_) {
        return std::nullopt;
    }
    return state_->orchestrator->video_id();
}

// ============================================================================
// Implementation
// ============================================================================

struct video_upload_client::impl {
    uploader_config config;
    std::shared_ptr<credential_manager> credentials;
    std::map<std::string, std::string> headers;
    std::string file_name;

    observer_list<upload_progress_event> progress_observers;
    observer_list<video_upload_response> playable_observers;

    std::unique_ptr<playable_poller> poller;

    std::mutex tasks_mutex;
    std::vector<std::future<void>> tasks;
    std::vector<std::weak_ptr<operation_state>> operations;

    explicit impl(uploader_config cfg) : config(std::move(cfg)) {}

    ~impl() {
        shutdown();
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    void shutdown() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(tasks_mutex);
            for (auto& weak : operations) {
                if (auto op = weak.lock()) {
                    op->source.cancel();
                }
            }
            operations.clear();
            pending = std::move(tasks);
            tasks.clear();
        }

        if (poller) {
            poller->stop();
        }

        for (auto& task : pending) {
            if (task.valid()) {
                task.wait();
            }
        }
    }

    void prune_finished() {
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
            [](const std::future<void>& f) {
                return !f.valid() ||
                       f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
            }), tasks.end());
        operations.erase(std::remove_if(operations.begin(), operations.end(),
            [](const std::weak_ptr<operation_state>& w) { return w.expired(); }),
            operations.end());
    }

    auto make_session(const std::string& operation_id) const -> upload_session {
        upload_session session;
        session.operation_id = operation_id;
        session.credentials = credentials;
        session.transport = config.transport;
        session.headers = headers;
        session.video_id = credentials->initial_video_id();
        session.strategy = config.strategy;
        session.file_path = config.file_path;
        session.file_name = file_name;
        session.chunk_size = config.chunk_size;
        return session;
    }

    void run_operation(const std::shared_ptr<operation_state>& op,
                       std::promise<result<video_upload_response>> promise) {
        auto outcome = op->orchestrator->run(op->source.token());

        config.registry->remove(op->id);
        op->settled.store(true);
        promise.set_value(outcome);

        if (!outcome || !config.playable_polling || playable_observers.empty()) {
            return;
        }
        if (!outcome.value().assets.hls) {
            VU_LOG_DEBUG(log_category::poller, "upload response has no hls asset, not polling");
            return;
        }

        auto polled = poller->wait_until_playable(outcome.value(),
            [this](const video_upload_response& response) {
                playable_observers.emit(response);
            });
        if (!polled && polled.error().code != error_code::aborted) {
            VU_LOG_WARN(log_category::poller, "playable polling ended: " + polled.error().message);
        }
    }
};

// ============================================================================
// Builder
// ============================================================================

video_upload_client::builder::builder() = default;

auto video_upload_client::builder::with_upload_token(
    std::string token, std::optional<std::string> video_id) -> builder& {
    ++config_.credential_count;
    config_.credentials = upload_token_credentials{std::move(token), std::move(video_id)};
    return *this;
}

auto video_upload_client::builder::with_access_token(
    std::string token, std::string video_id,
    std::optional<std::string> refresh_token) -> builder& {
    ++config_.credential_count;
    config_.credentials = access_token_credentials{
        std::move(token), std::move(refresh_token), std::move(video_id)};
    return *this;
}

auto video_upload_client::builder::with_api_key(std::string api_key, std::string video_id)
    -> builder& {
    ++config_.credential_count;
    config_.credentials = api_key_credentials{std::move(api_key), std::move(video_id)};
    return *this;
}

auto video_upload_client::builder::with_credentials(upload_credentials credentials) -> builder& {
    ++config_.credential_count;
    config_.credentials = std::move(credentials);
    return *this;
}

auto video_upload_client::builder::with_file(std::filesystem::path path) -> builder& {
    config_.file_path = std::move(path);
    return *this;
}

auto video_upload_client::builder::with_video_name(std::string name) -> builder& {
    config_.video_name = std::move(name);
    return *this;
}

auto video_upload_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto video_upload_client::builder::with_max_retries(std::size_t retries) -> builder& {
    config_.max_retries = retries;
    return *this;
}

auto video_upload_client::builder::with_retry_strategy(retry_strategy strategy) -> builder& {
    config_.strategy = std::move(strategy);
    return *this;
}

auto video_upload_client::builder::with_origin_app(std::string name, std::string version)
    -> builder& {
    config_.origin_app = origin_info{std::move(name), std::move(version)};
    return *this;
}

auto video_upload_client::builder::with_origin_sdk(std::string name, std::string version)
    -> builder& {
    config_.origin_sdk = origin_info{std::move(name), std::move(version)};
    return *this;
}

auto video_upload_client::builder::with_api_host(std::string host) -> builder& {
    config_.api_host = std::move(host);
    return *this;
}

auto video_upload_client::builder::with_transport(std::shared_ptr<http_transport> transport)
    -> builder& {
    config_.transport = std::move(transport);
    return *this;
}

auto video_upload_client::builder::with_registry(std::shared_ptr<operation_registry> registry)
    -> builder& {
    config_.registry = std::move(registry);
    return *this;
}

auto video_upload_client::builder::with_playable_polling(
    bool enable, std::chrono::milliseconds interval) -> builder& {
    config_.playable_polling = enable;
    config_.playable_poll_interval = interval;
    return *this;
}

auto video_upload_client::builder::with_skip_upload(bool skip) -> builder& {
    config_.skip_upload = skip;
    return *this;
}

auto video_upload_client::builder::build() -> result<video_upload_client> {
    if (config_.credential_count > 1) {
        return unexpected{error{error_code::invalid_configuration,
            "only one of upload token, access token or api key can be provided"}};
    }

    if (!config_.credentials && !config_.skip_upload) {
        return unexpected{error{error_code::missing_credentials,
            "you must provide either an access token, an upload token or an API key"}};
    }

    if (config_.file_path.empty()) {
        return unexpected{error{error_code::missing_file, "'file' is missing"}};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.file_path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "file not found: " + config_.file_path.string()}};
    }

    if (auto valid = chunk_config(config_.chunk_size).validate(); !valid) {
        return unexpected{valid.error()};
    }

    if (config_.origin_app) {
        if (auto valid = config_.origin_app->validate("application"); !valid) {
            return unexpected{valid.error()};
        }
    }
    if (config_.origin_sdk) {
        if (auto valid = config_.origin_sdk->validate("sdk"); !valid) {
            return unexpected{valid.error()};
        }
    }

    std::shared_ptr<credential_manager> credentials;
    if (config_.credentials) {
        auto created = credential_manager::create(*config_.credentials, config_.api_host);
        if (!created) {
            return unexpected{created.error()};
        }
        credentials = std::move(created.value());
    }

    if (!config_.strategy) {
        config_.strategy = make_default_retry_strategy(config_.max_retries);
    }
    if (!config_.transport) {
        if (!config_.skip_upload && !network_http_transport::is_available()) {
            return unexpected{error{error_code::not_available,
                "no HTTP transport: built without network_system and none was injected"}};
        }
        config_.transport = std::make_shared<network_http_transport>();
    }
    if (!config_.registry) {
        config_.registry = std::make_shared<operation_registry>();
    }

    video_upload_client client(std::move(config_));
    client.impl_->credentials = std::move(credentials);
    return client;
}

// ============================================================================
// video_upload_client
// ============================================================================

video_upload_client::video_upload_client(uploader_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();

    impl_->headers["AV-Origin-Client"] =
        std::string(origin_client_name) + ":" + version::to_string();
    if (impl_->config.origin_app) {
        impl_->headers["AV-Origin-App"] = impl_->config.origin_app->header_value();
    }
    if (impl_->config.origin_sdk) {
        impl_->headers["AV-Origin-Sdk"] = impl_->config.origin_sdk->header_value();
    }

    impl_->file_name = impl_->config.video_name.value_or(
        impl_->config.file_path.filename().string());

    impl_->poller = std::make_unique<playable_poller>(
        impl_->config.transport, impl_->config.playable_poll_interval);
}

video_upload_client::video_upload_client(video_upload_client&&) noexcept = default;
auto video_upload_client::operator=(video_upload_client&&) noexcept
    -> video_upload_client& = default;
video_upload_client::~video_upload_client() = default;

auto video_upload_client::upload() -> result<upload_handle> {
    if (impl_->config.skip_upload) {
        VU_LOG_INFO(log_category::uploader, "upload to the video API is disabled, skipping");
        return unexpected{error{error_code::upload_disabled,
            "upload to the video API is disabled"}};
    }

    auto op = std::make_shared<operation_state>();
    op->id = operation_registry::generate_id();
    while (!impl_->config.registry->insert(op->id, op->source)) {
        op->id = operation_registry::generate_id();
    }

    op->orchestrator = std::make_shared<upload_orchestrator>(
        impl_->make_session(op->id),
        [this_impl = impl_.get()](const upload_progress_event& event) {
            this_impl->progress_observers.emit(event);
        });

    std::promise<result<video_upload_response>> promise;
    op->outcome = promise.get_future().share();

    {
        std::lock_guard lock(impl_->tasks_mutex);
        impl_->prune_finished();
        impl_->operations.push_back(op);
        impl_->tasks.push_back(std::async(std::launch::async,
            [this_impl = impl_.get(), op, p = std::move(promise)]() mutable {
                this_impl->run_operation(op, std::move(p));
            }));
    }

    return upload_handle(op);
}

auto video_upload_client::on_progress(progress_callback callback) -> subscription_id {
    return impl_->progress_observers.subscribe(std::move(callback));
}

auto video_upload_client::remove_progress_observer(subscription_id id) -> bool {
    return impl_->progress_observers.unsubscribe(id);
}

auto video_upload_client::on_playable(playable_callback callback) -> subscription_id {
    return impl_->playable_observers.subscribe(std::move(callback));
}

auto video_upload_client::remove_playable_observer(subscription_id id) -> bool {
    return impl_->playable_observers.unsubscribe(id);
}

auto video_upload_client::cancel(const std::string& operation_id) -> bool {
    return impl_->config.registry->cancel(operation_id);
}

auto video_upload_client::active_operations() const -> std::size_t {
    std::lock_guard lock(impl_->tasks_mutex);
    std::size_t count = 0;
    for (const auto& weak : impl_->operations) {
        if (auto op = weak.lock(); op && !op->settled.load()) {
            ++count;
        }
    }
    return count;
}

auto video_upload_client::config() const -> const uploader_config& {
    return impl_->config;
}

}  // namespace kcenon::video_uploader
