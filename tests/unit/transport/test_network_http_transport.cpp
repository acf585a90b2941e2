/**
 * @file test_network_http_transport.cpp
 * @brief Unit tests for the network_system backed transport and http_response
 */

#include <gtest/gtest.h>

#include <kcenon/video_uploader/transport/network_http_transport.h>

namespace kcenon::video_uploader::test {

// =============================================================================
// http_response Tests
// =============================================================================

class HttpResponseTest : public ::testing::Test {};

TEST_F(HttpResponseTest, HeaderLookupIsCaseInsensitive) {
    http_response response;
    response.headers["Content-Type"] = "application/json";

    EXPECT_EQ(response.get_header("Content-Type"), "application/json");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_FALSE(response.get_header("X-Missing").has_value());
}

TEST_F(HttpResponseTest, ErrorStatus) {
    http_response response;
    response.status_code = 201;
    EXPECT_FALSE(response.is_error());

    response.status_code = 400;
    EXPECT_TRUE(response.is_error());
}

TEST_F(HttpResponseTest, BodyString) {
    http_response response;
    std::string text = R"({"videoId":"vi1"})";
    response.body.assign(text.begin(), text.end());

    EXPECT_EQ(response.get_body_string(), text);
}

// =============================================================================
// network_http_transport Tests
// =============================================================================

class NetworkHttpTransportTest : public ::testing::Test {};

TEST_F(NetworkHttpTransportTest, CancelledTokenAbortsBeforeSending) {
    network_http_transport transport;
    cancellation_source source;
    source.cancel();

    http_request request;
    request.url = "https://ws.api.video/upload?token=to1";

    auto response = transport.post(request, source.token(), nullptr);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, error_code::aborted);

    auto polled = transport.get("https://cdn.api.video/vi1/hls/manifest.m3u8", {}, source.token());
    ASSERT_FALSE(polled);
    EXPECT_EQ(polled.error().code, error_code::aborted);
}

TEST_F(NetworkHttpTransportTest, ReportsNotAvailableWithoutNetworkSystem) {
    if (network_http_transport::is_available()) {
        GTEST_SKIP() << "network_system is compiled in";
    }

    network_http_transport transport;
    http_request request;
    request.url = "https://ws.api.video/upload?token=to1";

    auto response = transport.post(request, cancellation_token{}, nullptr);
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, error_code::not_available);
}

TEST_F(NetworkHttpTransportTest, TimeoutFailureMapsToNetworkTimeout) {
    auto err = make_transport_failure("POST", "Request Timeout after 600000 ms");
    EXPECT_EQ(err.code, error_code::network_timeout);
    EXPECT_EQ(err.message, "HTTP POST request failed: Request Timeout after 600000 ms");

    EXPECT_EQ(make_transport_failure("GET", "operation timed out").code,
              error_code::network_timeout);
}

TEST_F(NetworkHttpTransportTest, OtherFailuresMapToNetworkError) {
    auto err = make_transport_failure("GET", "connection refused");
    EXPECT_EQ(err.code, error_code::network_error);
    EXPECT_EQ(err.message, "HTTP GET request failed: connection refused");

    EXPECT_EQ(make_transport_failure("POST", "").message, "HTTP POST request failed");
}

}  // namespace kcenon::video_uploader::test
