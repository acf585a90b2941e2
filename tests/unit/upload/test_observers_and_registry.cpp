/**
 * @file test_observers_and_registry.cpp
 * @brief Unit tests for observer_list and operation_registry
 */

#include <gtest/gtest.h>

#include <kcenon/video_uploader/upload/observer_list.h>
#include <kcenon/video_uploader/upload/operation_registry.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::video_uploader::test {

// =============================================================================
// observer_list Tests
// =============================================================================

class ObserverListTest : public ::testing::Test {};

TEST_F(ObserverListTest, EmitsInRegistrationOrder) {
    observer_list<int> observers;
    std::vector<std::string> calls;

    observers.subscribe([&](const int& v) { calls.push_back("a" + std::to_string(v)); });
    observers.subscribe([&](const int& v) { calls.push_back("b" + std::to_string(v)); });
    observers.emit(1);

    EXPECT_EQ(calls, (std::vector<std::string>{"a1", "b1"}));
}

TEST_F(ObserverListTest, IdsAreNonZeroAndUnique) {
    observer_list<int> observers;
    auto first = observers.subscribe([](const int&) {});
    auto second = observers.subscribe([](const int&) {});

    EXPECT_NE(first, 0u);
    EXPECT_NE(first, second);
    EXPECT_EQ(observers.size(), 2u);
}

TEST_F(ObserverListTest, Unsubscribe) {
    observer_list<int> observers;
    int calls = 0;
    auto id = observers.subscribe([&](const int&) { ++calls; });

    EXPECT_TRUE(observers.unsubscribe(id));
    EXPECT_FALSE(observers.unsubscribe(id));
    EXPECT_TRUE(observers.empty());

    observers.emit(1);
    EXPECT_EQ(calls, 0);
}

TEST_F(ObserverListTest, ObserverMayUnsubscribeDuringEmit) {
    observer_list<int> observers;
    int calls = 0;
    subscription_id id = 0;
    id = observers.subscribe([&](const int&) {
        ++calls;
        observers.unsubscribe(id);
    });

    observers.emit(1);
    observers.emit(2);

    EXPECT_EQ(calls, 1);
}

// =============================================================================
// operation_registry Tests
// =============================================================================

class OperationRegistryTest : public ::testing::Test {};

TEST_F(OperationRegistryTest, GeneratedIdsAreDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = operation_registry::generate_id();
        EXPECT_EQ(id.size(), 16u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(OperationRegistryTest, InsertCancelRemove) {
    operation_registry registry;
    cancellation_source source;

    EXPECT_TRUE(registry.insert("op1", source));
    EXPECT_FALSE(registry.insert("op1", cancellation_source{}));
    EXPECT_TRUE(registry.contains("op1"));
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(registry.cancel("op1"));
    EXPECT_TRUE(source.is_cancelled());

    EXPECT_TRUE(registry.remove("op1"));
    EXPECT_FALSE(registry.contains("op1"));
    EXPECT_FALSE(registry.cancel("op1"));
    EXPECT_FALSE(registry.remove("op1"));
}

TEST_F(OperationRegistryTest, CancelUnknownId) {
    operation_registry registry;
    EXPECT_FALSE(registry.cancel("nope"));
}

TEST_F(OperationRegistryTest, CancelAll) {
    operation_registry registry;
    cancellation_source a;
    cancellation_source b;
    registry.insert("a", a);
    registry.insert("b", b);

    EXPECT_EQ(registry.cancel_all(), 2u);
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());

    auto ids = registry.ids();
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()),
              (std::set<std::string>{"a", "b"}));
}

TEST_F(OperationRegistryTest, ConcurrentInsertAndCancel) {
    operation_registry registry;
    std::vector<cancellation_source> sources(200);
    std::atomic<int> cancelled{0};

    std::thread writer([&] {
        for (std::size_t i = 0; i < sources.size(); ++i) {
            registry.insert("op" + std::to_string(i), sources[i]);
        }
    });
    std::thread canceller([&] {
        for (std::size_t i = 0; i < sources.size(); ++i) {
            while (!registry.contains("op" + std::to_string(i))) {
                std::this_thread::yield();
            }
            if (registry.cancel("op" + std::to_string(i))) {
                ++cancelled;
            }
        }
    });

    writer.join();
    canceller.join();

    EXPECT_EQ(cancelled.load(), 200);
    EXPECT_EQ(registry.size(), 200u);
}

}  // namespace kcenon::video_uploader::test
