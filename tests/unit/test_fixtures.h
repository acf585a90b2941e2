/**
 * @file test_fixtures.h
 * @brief Shared fixtures for unit tests: temp files and a scripted transport
 */

#ifndef KCENON_VIDEO_UPLOADER_TEST_FIXTURES_H
#define KCENON_VIDEO_UPLOADER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/video_uploader/video_uploader.h>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::video_uploader::test {

inline constexpr std::size_t MiB = 1024 * 1024;

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("video_uploader_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /**
     * @brief Create a file whose byte at offset i is (i % 251)
     */
    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::vector<char> buffer(64 * 1024);
        std::size_t written = 0;
        while (written < size) {
            auto n = std::min(buffer.size(), size - written);
            for (std::size_t i = 0; i < n; ++i) {
                buffer[i] = static_cast<char>((written + i) % 251);
            }
            file.write(buffer.data(), static_cast<std::streamsize>(n));
            written += n;
        }

        return path;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Build an HTTP response with a text body
 */
inline auto make_response(int status, const std::string& body) -> http_response {
    http_response response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json";
    response.body.assign(body.begin(), body.end());
    return response;
}

/**
 * @brief Successful upload response for a video id, with an optional hls asset
 */
inline auto upload_ok(const std::string& video_id, const std::string& hls = "")
    -> http_response {
    std::string body = R"({"videoId":")" + video_id + R"(","title":"clip.mp4")";
    if (!hls.empty()) {
        body += R"(,"assets":{"hls":")" + hls + R"("})";
    }
    body += "}";
    return make_response(201, body);
}

/**
 * @brief In-memory transport returning scripted responses
 *
 * POST answers are taken from a queue; once the queue is empty the default
 * response is returned. Every request is recorded. A successful POST reports
 * progress in equal ticks (one by default) ending at the whole body.
 */
class mock_http_transport : public http_transport {
public:
    using post_hook = std::function<void(const http_request&, std::size_t call_index)>;

    void enqueue_post(result<http_response> response) {
        std::lock_guard lock(mutex_);
        post_queue_.push_back(std::move(response));
    }

    void enqueue_get(result<http_response> response) {
        std::lock_guard lock(mutex_);
        get_queue_.push_back(std::move(response));
    }

    void set_default_post(http_response response) {
        std::lock_guard lock(mutex_);
        default_post_ = std::move(response);
    }

    void set_default_get(http_response response) {
        std::lock_guard lock(mutex_);
        default_get_ = std::move(response);
    }

    void set_progress_ticks(std::size_t ticks) {
        std::lock_guard lock(mutex_);
        progress_ticks_ = std::max<std::size_t>(ticks, 1);
    }

    /**
     * @brief Hook run before each POST is answered
     */
    void set_post_hook(post_hook hook) {
        std::lock_guard lock(mutex_);
        hook_ = std::move(hook);
    }

    auto post(const http_request& request,
              const cancellation_token& token,
              const transfer_progress_callback& on_progress)
        -> result<http_response> override {
        post_hook hook;
        std::size_t index = 0;
        {
            std::lock_guard lock(mutex_);
            posts_.push_back(request);
            index = posts_.size() - 1;
            hook = hook_;
        }
        if (hook) {
            hook(request, index);
        }
        if (token.is_cancelled()) {
            return unexpected(error{error_code::aborted, "request cancelled"});
        }

        result<http_response> answer;
        std::size_t ticks = 1;
        {
            std::lock_guard lock(mutex_);
            ticks = progress_ticks_;
            if (!post_queue_.empty()) {
                answer = std::move(post_queue_.front());
                post_queue_.pop_front();
            } else {
                answer = default_post_;
            }
        }

        if (answer && on_progress) {
            const uint64_t total = request.body.size();
            for (std::size_t i = 1; i <= ticks; ++i) {
                on_progress(total * i / ticks, total);
            }
        }
        return answer;
    }

    auto get(const std::string& url,
             const std::map<std::string, std::string>& headers,
             const cancellation_token& token) -> result<http_response> override {
        (void)headers;
        {
            std::lock_guard lock(mutex_);
            get_urls_.push_back(url);
        }
        if (token.is_cancelled()) {
            return unexpected(error{error_code::aborted, "request cancelled"});
        }

        std::lock_guard lock(mutex_);
        if (!get_queue_.empty()) {
            auto answer = std::move(get_queue_.front());
            get_queue_.pop_front();
            return answer;
        }
        return default_get_;
    }

    [[nodiscard]] auto posts() const -> std::vector<http_request> {
        std::lock_guard lock(mutex_);
        return posts_;
    }

    [[nodiscard]] auto post_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return posts_.size();
    }

    [[nodiscard]] auto get_urls() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return get_urls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<result<http_response>> post_queue_;
    std::deque<result<http_response>> get_queue_;
    http_response default_post_ = upload_ok("vi_default");
    http_response default_get_ = make_response(200, "#EXTM3U");
    post_hook hook_;
    std::size_t progress_ticks_ = 1;
    std::vector<http_request> posts_;
    std::vector<std::string> get_urls_;
};

/**
 * @brief Body of a recorded request as text
 */
inline auto body_string(const http_request& request) -> std::string {
    return std::string(request.body.begin(), request.body.end());
}

/**
 * @brief Wait function that records delays and never blocks
 */
struct recorded_waits {
    std::mutex mutex;
    std::vector<std::chrono::milliseconds> delays;

    auto function() -> retrier::wait_function {
        return [this](std::chrono::milliseconds delay, const cancellation_token& token) {
            std::lock_guard lock(mutex);
            delays.push_back(delay);
            return !token.is_cancelled();
        };
    }
};

}  // namespace kcenon::video_uploader::test

#endif  // KCENON_VIDEO_UPLOADER_TEST_FIXTURES_H
