/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/video_uploader/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::video_uploader::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_TRUE(config.mask_credentials);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_credentials);
    EXPECT_TRUE(config.mask_paths);
}

TEST_F(MaskingConfigTest, NoneConfig) {
    auto config = masking_config::none();

    EXPECT_FALSE(config.mask_credentials);
    EXPECT_FALSE(config.mask_paths);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, MasksUploadTokenInUrl) {
    sensitive_info_masker masker;

    auto result = masker.mask("https://ws.api.video/upload?token=to1R5LOYV0091XN3GQva27OS");

    EXPECT_EQ(result, "https://ws.api.video/upload?token=to1R********************");
}

TEST_F(SensitiveInfoMaskerTest, MasksAuthorizationValues) {
    sensitive_info_masker masker;

    EXPECT_EQ(masker.mask("Authorization: Bearer abcd1234efgh"),
              "Authorization: Bearer abcd********");
    EXPECT_EQ(masker.mask("Authorization: Basic YWJjZDo="),
              "Authorization: Basic YWJj****");
}

TEST_F(SensitiveInfoMaskerTest, ShortSecretsFullyMasked) {
    sensitive_info_masker masker;

    EXPECT_EQ(masker.mask_secret("abc"), "***");
}

TEST_F(SensitiveInfoMaskerTest, NoMaskingWhenDisabled) {
    sensitive_info_masker masker(masking_config::none());
    std::string input = "token=secretvalue at /home/user/videos/clip.mp4";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskPaths) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto result = masker.mask_path("/home/user/clip.mp4");

    EXPECT_EQ(result, "**********/clip.mp4");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInMessage) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto result = masker.mask("reading /home/user/clip.mp4");

    EXPECT_EQ(result, "reading **********/clip.mp4");
}

// =============================================================================
// Upload Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContext) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, FieldsInJson) {
    upload_log_context ctx;
    ctx.operation_id = "op1";
    ctx.video_id = "vi123";
    ctx.chunk_index = 2;
    ctx.total_chunks = 3;
    ctx.retry_delay_ms = 4200;
    ctx.http_status = 503;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"operation_id\":\"op1\""), std::string::npos);
    EXPECT_NE(json.find("\"video_id\":\"vi123\""), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":2"), std::string::npos);
    EXPECT_NE(json.find("\"total_chunks\":3"), std::string::npos);
    EXPECT_NE(json.find("\"retry_delay_ms\":4200"), std::string::npos);
    EXPECT_NE(json.find("\"http_status\":503"), std::string::npos);
}

TEST_F(UploadLogContextTest, EndpointMaskedWithMasker) {
    upload_log_context ctx;
    ctx.endpoint = "https://ws.api.video/upload?token=to1234567890";
    sensitive_info_masker masker;

    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("to1234567890"), std::string::npos);
    EXPECT_NE(json.find("token=to12"), std::string::npos);
}

TEST_F(UploadLogContextTest, EscapesSpecialCharacters) {
    upload_log_context ctx;
    ctx.error_message = "bad \"quote\"\nline";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("bad \\\"quote\\\"\\nline"), std::string::npos);
}

// =============================================================================
// Uploader Logger Tests
// =============================================================================

class UploaderLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = get_logger().get_level();
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(saved_level_);
        get_logger().set_masking_config(masking_config{});
        get_logger().set_output_format(log_output_format::text);
    }

    log_level saved_level_ = log_level::info;
};

TEST_F(UploaderLoggerTest, LevelFiltering) {
    auto& logger = get_logger();
    logger.set_level(log_level::warn);

    EXPECT_FALSE(logger.is_enabled(log_level::info));
    EXPECT_TRUE(logger.is_enabled(log_level::warn));
    EXPECT_TRUE(logger.is_enabled(log_level::error));
}

TEST_F(UploaderLoggerTest, CallbackReceivesMaskedMessage) {
    auto& logger = get_logger();
    logger.set_level(log_level::trace);

    std::vector<std::string> messages;
    std::vector<std::string> categories;
    logger.set_callback([&](log_level, std::string_view category, std::string_view message,
                            const upload_log_context*) {
        categories.emplace_back(category);
        messages.emplace_back(message);
    });

    VU_LOG_INFO(log_category::auth, "using Bearer abcd1234efgh");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "using Bearer abcd********");
    EXPECT_EQ(categories[0], "video_uploader.auth");
}

TEST_F(UploaderLoggerTest, CallbackReceivesContext) {
    auto& logger = get_logger();
    logger.set_level(log_level::trace);

    std::optional<uint32_t> seen_chunk;
    logger.set_callback([&](log_level, std::string_view, std::string_view,
                            const upload_log_context* ctx) {
        if (ctx) {
            seen_chunk = ctx->chunk_index;
        }
    });

    upload_log_context ctx;
    ctx.chunk_index = 7;
    VU_LOG_DEBUG_CTX(log_category::uploader, "chunk uploaded", ctx);

    EXPECT_EQ(seen_chunk, 7u);
}

TEST_F(UploaderLoggerTest, FilteredMessagesSkipCallback) {
    auto& logger = get_logger();
    logger.set_level(log_level::error);

    int calls = 0;
    logger.set_callback([&](log_level, std::string_view, std::string_view,
                            const upload_log_context*) { ++calls; });

    VU_LOG_INFO(log_category::uploader, "not emitted");
    VU_LOG_ERROR(log_category::uploader, "emitted");

    EXPECT_EQ(calls, 1);
}

TEST_F(UploaderLoggerTest, OutputFormatRoundTrip) {
    auto& logger = get_logger();
    logger.set_output_format(log_output_format::json);
    EXPECT_EQ(logger.get_output_format(), log_output_format::json);
}

}  // namespace kcenon::video_uploader::test
