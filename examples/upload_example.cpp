/**
 * @file upload_example.cpp
 * @brief Chunked video upload example with progress and playable callbacks
 *
 * This example demonstrates:
 * - Choosing a credential shape (upload token, access token or API key)
 * - Configuring chunk size and retries
 * - Using progress callbacks to monitor upload status
 * - Waiting for the video to become playable
 * - Cancelling an upload with Ctrl+C
 */

#include <kcenon/video_uploader/video_uploader.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace kcenon::video_uploader;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_size(const std::string& size_str) -> std::size_t {
    std::size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<std::size_t>(value * 1024);
            case 'M': return static_cast<std::size_t>(value * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Video Uploader" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <video_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Credentials (exactly one):" << std::endl;
    std::cout << "  -t, --upload-token <token>   Delegated upload token" << std::endl;
    std::cout << "  -a, --access-token <token>   Access token (needs --video-id)" << std::endl;
    std::cout << "  -k, --api-key <key>          API key (needs --video-id)" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -v, --video-id <id>          Upload into an existing video" << std::endl;
    std::cout << "  -r, --refresh-token <token>  Refresh token for --access-token" << std::endl;
    std::cout << "  -c, --chunk-size <size>      Chunk size, 5M to 128M (default: 50M)" << std::endl;
    std::cout << "  -n, --name <name>            File name sent to the server" << std::endl;
    std::cout << "  --retries <count>            Retries per chunk (default: 6)" << std::endl;
    std::cout << "  --host <host>                API host (default: ws.api.video)" << std::endl;
    std::cout << "  --wait-playable              Wait until the video can be played" << std::endl;
    std::cout << "  --help                       Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " -t to1tcmSFHeYY5KzyhOqVKMKb clip.mp4" << std::endl;
    std::cout << "  " << program << " -k MY_API_KEY -v vi4k0jvEUuaTdRAEjQ4Jfrgz -c 10M clip.mp4" << std::endl;
}

int main(int argc, char* argv[]) {
    std::optional<std::string> upload_token;
    std::optional<std::string> access_token;
    std::optional<std::string> api_key;
    std::optional<std::string> video_id;
    std::optional<std::string> refresh_token;
    std::optional<std::string> video_name;
    std::optional<std::string> host;
    std::size_t chunk_size = chunk_config::default_chunk_size;
    std::size_t retries = default_max_retries;
    bool wait_playable = false;
    std::string file_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* option) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        std::optional<std::string>* target = nullptr;
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-t" || arg == "--upload-token") {
            target = &upload_token;
        } else if (arg == "-a" || arg == "--access-token") {
            target = &access_token;
        } else if (arg == "-k" || arg == "--api-key") {
            target = &api_key;
        } else if (arg == "-v" || arg == "--video-id") {
            target = &video_id;
        } else if (arg == "-r" || arg == "--refresh-token") {
            target = &refresh_token;
        } else if (arg == "-n" || arg == "--name") {
            target = &video_name;
        } else if (arg == "--host") {
            target = &host;
        } else if (arg == "-c" || arg == "--chunk-size" || arg == "--retries") {
            auto value = next(arg.c_str());
            if (!value) {
                return 1;
            }
            try {
                if (arg == "--retries") {
                    retries = static_cast<std::size_t>(std::stoul(*value));
                } else {
                    chunk_size = parse_size(*value);
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
                return 1;
            }
            continue;
        } else if (arg == "--wait-playable") {
            wait_playable = true;
            continue;
        } else if (arg[0] != '-') {
            file_path = arg;
            continue;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        }

        *target = next(arg.c_str());
        if (!*target) {
            return 1;
        }
    }

    if (file_path.empty()) {
        std::cerr << "Error: video_file is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Build the uploader; credential and file problems are reported here
    std::cout << "[1/3] Creating uploader..." << std::endl;
    video_upload_client::builder builder;
    builder.with_file(file_path)
           .with_chunk_size(chunk_size)
           .with_max_retries(retries)
           .with_origin_app("upload-example", "1.0");

    if (upload_token) {
        builder.with_upload_token(*upload_token, video_id);
    }
    if (access_token) {
        builder.with_access_token(*access_token, video_id.value_or(""), refresh_token);
    }
    if (api_key) {
        builder.with_api_key(*api_key, video_id.value_or(""));
    }
    if (video_name) {
        builder.with_video_name(*video_name);
    }
    if (host) {
        builder.with_api_host(*host);
    }

    auto uploader_result = builder.build();
    if (!uploader_result.has_value()) {
        std::cerr << "Failed to create uploader: " << uploader_result.error().message
                  << std::endl;
        return 1;
    }

    auto& uploader = uploader_result.value();

    uploader.on_progress([](const upload_progress_event& progress) {
        constexpr int bar_width = 30;
        double percentage = progress.completion_percentage();
        int filled = static_cast<int>(percentage / 100.0 * bar_width);

        std::cout << "\r[";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) std::cout << "=";
            else if (i == filled) std::cout << ">";
            else std::cout << " ";
        }
        std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%"
                  << " | chunk " << progress.current_chunk << "/" << progress.chunks_count
                  << " | " << format_bytes(progress.uploaded_bytes) << "/"
                  << format_bytes(progress.total_bytes)
                  << "     " << std::flush;
    });

    std::promise<void> playable;
    auto playable_future = playable.get_future();
    if (wait_playable) {
        uploader.on_playable([&playable](const video_upload_response& response) {
            std::cout << "[Playable] " << response.video_id << " can be played" << std::endl;
            playable.set_value();
        });
    }

    std::signal(SIGINT, on_signal);

    std::cout << "[2/3] Starting upload of " << file_path << " ("
              << format_bytes(std::filesystem::file_size(file_path)) << ")..." << std::endl;
    auto handle_result = uploader.upload();
    if (!handle_result.has_value()) {
        std::cerr << "Failed to start upload: " << handle_result.error().message << std::endl;
        return 1;
    }

    auto& handle = handle_result.value();
    std::cout << "Upload started with operation ID: " << handle.id() << std::endl;

    std::cout << "[3/3] Waiting for upload to complete (Ctrl+C to cancel)..." << std::endl;
    result<video_upload_response> outcome = handle.wait_for(std::chrono::milliseconds{200});
    while (!outcome.has_value() && outcome.error().code == error_code::wait_timeout) {
        if (g_interrupted.load() && handle.cancel()) {
            std::cout << std::endl << "Cancelling..." << std::endl;
        }
        outcome = handle.wait_for(std::chrono::milliseconds{200});
    }
    std::cout << std::endl;

    if (!outcome.has_value()) {
        if (outcome.error().code == error_code::aborted) {
            std::cout << "[Aborted] Upload cancelled" << std::endl;
        } else {
            std::cerr << "[Failed] " << outcome.error().message << std::endl;
        }
        return 1;
    }

    const auto& video = outcome.value();
    std::cout << "========================================" << std::endl;
    std::cout << "  Video ID: " << video.video_id << std::endl;
    if (video.title) {
        std::cout << "  Title: " << *video.title << std::endl;
    }
    if (video.assets.player) {
        std::cout << "  Player: " << *video.assets.player << std::endl;
    }
    if (video.assets.hls) {
        std::cout << "  HLS: " << *video.assets.hls << std::endl;
    }
    std::cout << "========================================" << std::endl;

    if (wait_playable && video.assets.hls) {
        std::cout << "Waiting for the video to become playable..." << std::endl;
        while (playable_future.wait_for(std::chrono::milliseconds{200}) !=
               std::future_status::ready) {
            if (g_interrupted.load()) {
                std::cout << "Stopped waiting" << std::endl;
                return 0;
            }
        }
    }

    return 0;
}
