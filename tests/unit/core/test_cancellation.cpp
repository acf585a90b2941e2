/**
 * @file test_cancellation.cpp
 * @brief Unit tests for cancellation_source and cancellation_token
 */

#include <gtest/gtest.h>

#include <kcenon/video_uploader/core/cancellation.h>

#include <chrono>
#include <thread>

namespace kcenon::video_uploader::test {

using namespace std::chrono_literals;

class CancellationTest : public ::testing::Test {};

TEST_F(CancellationTest, DefaultTokenIsNeverCancelled) {
    cancellation_token token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.wait_for(1ms));
}

TEST_F(CancellationTest, CancelIsObservedByTokens) {
    cancellation_source source;
    auto token = source.token();

    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(source.cancel());
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(source.is_cancelled());
}

TEST_F(CancellationTest, CancelOnlyOnce) {
    cancellation_source source;
    EXPECT_TRUE(source.cancel());
    EXPECT_FALSE(source.cancel());
}

TEST_F(CancellationTest, CopiedSourceSharesState) {
    cancellation_source source;
    cancellation_source copy = source;

    copy.cancel();
    EXPECT_TRUE(source.is_cancelled());
}

TEST_F(CancellationTest, WaitCompletesWhenNotCancelled) {
    cancellation_source source;
    EXPECT_TRUE(source.token().wait_for(5ms));
}

TEST_F(CancellationTest, WaitReturnsImmediatelyWhenAlreadyCancelled) {
    cancellation_source source;
    source.cancel();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(source.token().wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(CancellationTest, CancelWakesWaiter) {
    cancellation_source source;
    auto token = source.token();

    bool completed = true;
    std::thread waiter([&] { completed = token.wait_for(30s); });

    std::this_thread::sleep_for(20ms);
    auto start = std::chrono::steady_clock::now();
    source.cancel();
    waiter.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

}  // namespace kcenon::video_uploader::test
