/**
 * @file test_video_upload_client.cpp
 * @brief Unit tests for the uploader builder and upload lifecycle
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace kcenon::video_uploader::test {

using namespace std::chrono_literals;

namespace {

auto fast_retries() -> retry_strategy {
    return [](std::size_t retry_count, const error& err)
        -> std::optional<std::chrono::milliseconds> {
        if (err.http_status >= 400 && err.http_status < 500) {
            return std::nullopt;
        }
        return retry_count < 3 ? std::optional(1ms) : std::nullopt;
    };
}

}  // namespace

class VideoUploadClientTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        transport_ = std::make_shared<mock_http_transport>();
        file_ = create_test_file("clip.mp4", 1 * MiB);
    }

    void TearDown() override {
        release_.store(true);
        TempDirectoryFixture::TearDown();
    }

    auto base_builder() -> video_upload_client::builder {
        video_upload_client::builder b;
        b.with_upload_token("to1234")
         .with_file(file_)
         .with_chunk_size(5 * MiB)
         .with_transport(transport_)
         .with_retry_strategy(fast_retries());
        return b;
    }

    /**
     * @brief Make every POST block until release_ is set
     */
    void hold_posts() {
        transport_->set_post_hook([this](const http_request&, std::size_t) {
            auto deadline = std::chrono::steady_clock::now() + 5s;
            while (!release_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(1ms);
            }
        });
    }

    std::shared_ptr<mock_http_transport> transport_;
    std::filesystem::path file_;
    std::atomic<bool> release_{false};
};

// =============================================================================
// Builder Tests
// =============================================================================

TEST_F(VideoUploadClientTest, BuildWithDefaults) {
    if (!network_http_transport::is_available()) {
        GTEST_SKIP() << "network_system not available";
    }

    auto uploader = video_upload_client::builder()
        .with_upload_token("to1234")
        .with_file(file_)
        .build();

    ASSERT_TRUE(uploader.has_value());
    const auto& config = uploader.value().config();
    EXPECT_EQ(config.chunk_size, chunk_config::default_chunk_size);
    EXPECT_EQ(config.api_host, "ws.api.video");
    EXPECT_TRUE(config.transport != nullptr);
    EXPECT_TRUE(config.registry != nullptr);
    EXPECT_TRUE(static_cast<bool>(config.strategy));
}

TEST_F(VideoUploadClientTest, BuildWithoutHttpClientFails) {
    if (network_http_transport::is_available()) {
        GTEST_SKIP() << "network_system is linked in";
    }

    auto uploader = video_upload_client::builder()
        .with_upload_token("to1234")
        .with_file(file_)
        .build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::not_available);
}

TEST_F(VideoUploadClientTest, SkipModeNeedsNoHttpClient) {
    auto uploader = video_upload_client::builder()
        .with_file(file_)
        .with_skip_upload(true)
        .build();

    ASSERT_TRUE(uploader.has_value());
    EXPECT_TRUE(uploader.value().config().transport != nullptr);
}

TEST_F(VideoUploadClientTest, MultipleCredentialsRejected) {
    auto uploader = base_builder().with_api_key("abcd", "vi1").build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::invalid_configuration);
}

TEST_F(VideoUploadClientTest, MissingCredentials) {
    auto uploader = video_upload_client::builder().with_file(file_).build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::missing_credentials);
}

TEST_F(VideoUploadClientTest, MissingFile) {
    auto uploader = video_upload_client::builder().with_upload_token("to1234").build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::missing_file);
    EXPECT_EQ(uploader.error().message, "'file' is missing");
}

TEST_F(VideoUploadClientTest, NonexistentFile) {
    auto uploader = base_builder().with_file(test_dir_ / "nope.mp4").build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::file_not_found);
}

TEST_F(VideoUploadClientTest, DirectoryIsNotAFile) {
    auto uploader = base_builder().with_file(test_dir_).build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::file_not_found);
}

TEST_F(VideoUploadClientTest, ChunkSizeBounds) {
    auto too_small = base_builder().with_chunk_size(5 * MiB - 1).build();
    ASSERT_FALSE(too_small.has_value());
    EXPECT_EQ(too_small.error().code, error_code::invalid_chunk_size);

    auto too_large = base_builder().with_chunk_size(128 * MiB + 1).build();
    ASSERT_FALSE(too_large.has_value());
    EXPECT_EQ(too_large.error().code, error_code::invalid_chunk_size);

    EXPECT_TRUE(base_builder().with_chunk_size(128 * MiB).build().has_value());
}

TEST_F(VideoUploadClientTest, InvalidOrigin) {
    auto bad_name = base_builder().with_origin_app("bad name", "1.0").build();
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code, error_code::invalid_origin);

    auto bad_version = base_builder().with_origin_sdk("sdk", "1.2.3.4").build();
    ASSERT_FALSE(bad_version.has_value());
    EXPECT_EQ(bad_version.error().code, error_code::invalid_origin);
}

TEST_F(VideoUploadClientTest, AccessTokenRequiresVideoId) {
    auto uploader = video_upload_client::builder()
        .with_access_token("at", "")
        .with_file(file_)
        .build();

    ASSERT_FALSE(uploader.has_value());
    EXPECT_EQ(uploader.error().code, error_code::missing_video_id);
}

TEST_F(VideoUploadClientTest, SkipUploadNeedsNoCredentials) {
    auto uploader = video_upload_client::builder()
        .with_file(file_)
        .with_transport(transport_)
        .with_skip_upload(true)
        .build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, error_code::upload_disabled);
    EXPECT_EQ(transport_->post_count(), 0u);
}

// =============================================================================
// Upload Tests
// =============================================================================

TEST_F(VideoUploadClientTest, UploadSucceeds) {
    transport_->enqueue_post(upload_ok("vi1"));
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(handle.value().is_valid());
    EXPECT_EQ(handle.value().id().size(), 16u);

    auto response = handle.value().wait();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().video_id, "vi1");
    EXPECT_EQ(handle.value().status(), upload_status::done);
    EXPECT_EQ(handle.value().video_id(), "vi1");
    EXPECT_EQ(uploader.value().active_operations(), 0u);
}

TEST_F(VideoUploadClientTest, OriginHeaders) {
    auto uploader = base_builder()
        .with_origin_app("my-app", "2.1")
        .with_origin_sdk("wrapper_sdk", "1.0.3")
        .build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    auto posts = transport_->posts();
    ASSERT_EQ(posts.size(), 1u);
    EXPECT_EQ(posts[0].headers.at("AV-Origin-Client"),
              "cpp-video-uploader:" + version::to_string());
    EXPECT_EQ(posts[0].headers.at("AV-Origin-App"), "my-app:2.1");
    EXPECT_EQ(posts[0].headers.at("AV-Origin-Sdk"), "wrapper_sdk:1.0.3");
}

TEST_F(VideoUploadClientTest, VideoNameOverridesFileName) {
    auto uploader = base_builder().with_video_name("holiday.mp4").build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    auto posts = transport_->posts();
    ASSERT_EQ(posts.size(), 1u);
    EXPECT_NE(body_string(posts[0]).find("filename=\"holiday.mp4\""), std::string::npos);
}

TEST_F(VideoUploadClientTest, ProgressObserversNotified) {
    file_ = create_test_file("big.mp4", 11 * MiB);
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    std::mutex mutex;
    std::vector<upload_progress_event> events;
    int removed_calls = 0;
    uploader.value().on_progress([&](const upload_progress_event& e) {
        std::lock_guard lock(mutex);
        events.push_back(e);
    });
    auto removed = uploader.value().on_progress([&](const upload_progress_event&) {
        ++removed_calls;
    });
    EXPECT_TRUE(uploader.value().remove_progress_observer(removed));

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    std::lock_guard lock(mutex);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.back().uploaded_bytes, 11 * MiB);
    EXPECT_EQ(events.back().total_bytes, 11 * MiB);
    EXPECT_EQ(events.back().current_chunk, 3u);
    EXPECT_EQ(removed_calls, 0);
}

TEST_F(VideoUploadClientTest, PlayableObserverNotified) {
    transport_->enqueue_post(upload_ok("vi1", "https://cdn.api.video/vod/vi1/hls/manifest.m3u8"));
    transport_->enqueue_get(make_response(202, ""));

    auto uploader = base_builder().with_playable_polling(true, 1ms).build();
    ASSERT_TRUE(uploader.has_value());

    std::promise<std::string> playable;
    std::atomic<int> calls{0};
    uploader.value().on_playable([&](const video_upload_response& r) {
        if (calls.fetch_add(1) == 0) {
            playable.set_value(r.video_id);
        }
    });
    auto notified = playable.get_future();

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    ASSERT_EQ(notified.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(notified.get(), "vi1");
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(transport_->get_urls().size(), 2u);
}

TEST_F(VideoUploadClientTest, NoPollingWithoutPlayableObservers) {
    transport_->enqueue_post(upload_ok("vi1", "https://cdn.api.video/vod/vi1/hls/manifest.m3u8"));
    auto uploader = base_builder().with_playable_polling(true, 1ms).build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(transport_->get_urls().empty());
}

TEST_F(VideoUploadClientTest, FailedUploadReportsError) {
    transport_->set_default_post(make_response(403, R"({"title":"Forbidden","status":403})"));
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());

    auto response = handle.value().wait();
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().http_status, 403);
    EXPECT_EQ(handle.value().status(), upload_status::failed);
    EXPECT_EQ(transport_->post_count(), 1u);
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(VideoUploadClientTest, CancelThroughHandle) {
    hold_posts();
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(uploader.value().active_operations(), 1u);

    EXPECT_TRUE(handle.value().cancel());
    EXPECT_FALSE(handle.value().cancel());
    release_.store(true);

    auto response = handle.value().wait();
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::aborted);
    EXPECT_EQ(handle.value().status(), upload_status::aborted);
    EXPECT_EQ(uploader.value().active_operations(), 0u);
}

TEST_F(VideoUploadClientTest, CancelThroughClientById) {
    hold_posts();
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());

    EXPECT_FALSE(uploader.value().cancel("unknown"));
    EXPECT_TRUE(uploader.value().cancel(handle.value().id()));
    release_.store(true);

    auto response = handle.value().wait();
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::aborted);
    EXPECT_FALSE(uploader.value().cancel(handle.value().id()));
}

TEST_F(VideoUploadClientTest, CancelAfterCompletionIsNoOp) {
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().wait().has_value());

    EXPECT_FALSE(handle.value().cancel());
    EXPECT_EQ(handle.value().status(), upload_status::done);
}

TEST_F(VideoUploadClientTest, WaitForTimesOut) {
    hold_posts();
    auto uploader = base_builder().build();
    ASSERT_TRUE(uploader.has_value());

    auto handle = uploader.value().upload();
    ASSERT_TRUE(handle.has_value());

    auto pending = handle.value().wait_for(10ms);
    ASSERT_FALSE(pending.has_value());
    EXPECT_EQ(pending.error().code, error_code::wait_timeout);

    release_.store(true);
    auto response = handle.value().wait_for(5s);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().video_id, "vi_default");
}

TEST_F(VideoUploadClientTest, DestroyingClientCancelsUploads) {
    hold_posts();
    upload_handle handle;
    std::thread releaser;
    {
        auto uploader = base_builder().build();
        ASSERT_TRUE(uploader.has_value());
        auto started = uploader.value().upload();
        ASSERT_TRUE(started.has_value());
        handle = started.value();

        releaser = std::thread([this] {
            std::this_thread::sleep_for(50ms);
            release_.store(true);
        });
    }
    releaser.join();

    auto response = handle.wait_for(5s);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::aborted);
}

TEST_F(VideoUploadClientTest, SharedRegistryTracksOperations) {
    hold_posts();
    auto registry = std::make_shared<operation_registry>();
    auto uploader = base_builder().with_registry(registry).build();
    ASSERT_TRUE(uploader.has_value());

    auto first = uploader.value().upload();
    auto second = uploader.value().upload();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first.value().id(), second.value().id());
    EXPECT_EQ(registry->size(), 2u);
    EXPECT_EQ(uploader.value().active_operations(), 2u);

    EXPECT_EQ(registry->cancel_all(), 2u);
    release_.store(true);

    EXPECT_EQ(first.value().wait().error().code, error_code::aborted);
    EXPECT_EQ(second.value().wait().error().code, error_code::aborted);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(VideoUploadClientTest, DefaultHandleIsInvalid) {
    upload_handle handle;
    EXPECT_FALSE(handle.is_valid());
    EXPECT_TRUE(handle.id().empty());
    EXPECT_FALSE(handle.cancel());
    EXPECT_EQ(handle.wait().error().code, error_code::internal_error);
    EXPECT_FALSE(handle.video_id().has_value());
}

}  // namespace kcenon::video_uploader::test
