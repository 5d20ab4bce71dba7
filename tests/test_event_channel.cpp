/**
 * @file test_event_channel.cpp
 * @brief Unit tests for the watch and broadcast channels
 */

#include "asmd/event_channel.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <gtest/gtest.h>

using namespace asmd;
using namespace std::chrono_literals;

// ============================================================
// WatchChannel
// ============================================================

TEST(WatchChannelTest, NewReceiverSeesNoChange) {
    WatchChannel<int> channel(7);
    auto rx = channel.subscribe();

    EXPECT_FALSE(rx.has_changed());
    EXPECT_EQ(rx.borrow(), 7);
}

TEST(WatchChannelTest, LatestValueWins) {
    WatchChannel<std::optional<std::string>> channel;
    auto rx = channel.subscribe();

    channel.send(std::string("first"));
    channel.send(std::string("second"));

    ASSERT_TRUE(rx.has_changed());
    auto value = rx.borrow_and_update();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "second");
    EXPECT_FALSE(rx.has_changed());
}

TEST(WatchChannelTest, BorrowDoesNotMarkSeen) {
    WatchChannel<int> channel(0);
    auto rx = channel.subscribe();

    channel.send(1);
    EXPECT_EQ(rx.borrow(), 1);
    EXPECT_TRUE(rx.has_changed());
}

TEST(WatchChannelTest, ReceiversTrackIndependently) {
    WatchChannel<int> channel(0);
    auto a = channel.subscribe();
    auto b = channel.subscribe();

    channel.send(5);
    a.borrow_and_update();

    EXPECT_FALSE(a.has_changed());
    EXPECT_TRUE(b.has_changed());
}

TEST(WatchChannelTest, WaitChangedWakesOnSend) {
    WatchChannel<int> channel(0);
    auto rx = channel.subscribe();

    std::thread sender([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.send(3);
    });

    EXPECT_TRUE(rx.wait_changed(2000ms));
    EXPECT_EQ(rx.borrow_and_update(), 3);
    sender.join();
}

TEST(WatchChannelTest, WaitChangedTimesOut) {
    WatchChannel<int> channel(0);
    auto rx = channel.subscribe();

    EXPECT_FALSE(rx.wait_changed(20ms));
}

// ============================================================
// BroadcastChannel
// ============================================================

TEST(BroadcastChannelTest, EverySubscriberGetsEveryValue) {
    BroadcastChannel<int> channel(4);
    auto a = channel.subscribe();
    auto b = channel.subscribe();

    EXPECT_EQ(channel.send(1), 2u);
    EXPECT_EQ(channel.send(2), 2u);

    EXPECT_EQ(a.try_recv().value_or(-1), 1);
    EXPECT_EQ(a.try_recv().value_or(-1), 2);
    EXPECT_EQ(b.try_recv().value_or(-1), 1);
    EXPECT_EQ(b.try_recv().value_or(-1), 2);
    EXPECT_FALSE(a.try_recv().has_value());
}

TEST(BroadcastChannelTest, SendWithoutSubscribersIsDropped) {
    BroadcastChannel<int> channel(4);

    EXPECT_EQ(channel.send(1), 0u);

    auto late = channel.subscribe();
    EXPECT_FALSE(late.try_recv().has_value());
}

TEST(BroadcastChannelTest, SlowReceiverLosesOldestValues) {
    BroadcastChannel<int> channel(3);
    auto rx = channel.subscribe();

    for (int i = 1; i <= 5; ++i) {
        channel.send(i);
    }

    EXPECT_EQ(rx.lagged(), 2u);
    EXPECT_EQ(rx.pending(), 3u);
    EXPECT_EQ(rx.try_recv().value_or(-1), 3);
    EXPECT_EQ(rx.try_recv().value_or(-1), 4);
    EXPECT_EQ(rx.try_recv().value_or(-1), 5);
}

TEST(BroadcastChannelTest, DroppedReceiverIsPruned) {
    BroadcastChannel<int> channel(4);
    auto kept = channel.subscribe();
    {
        auto dropped = channel.subscribe();
    }

    EXPECT_EQ(channel.send(1), 1u);
}

TEST(BroadcastChannelTest, RecvWaitsForValue) {
    BroadcastChannel<bool> channel(1);
    auto rx = channel.subscribe();

    std::thread sender([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.send(true);
    });

    auto value = rx.recv(2000ms);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(*value);
    sender.join();
}

TEST(BroadcastChannelTest, RecvTimesOutEmpty) {
    BroadcastChannel<bool> channel(1);
    auto rx = channel.subscribe();

    EXPECT_FALSE(rx.recv(20ms).has_value());
}

TEST(BroadcastChannelTest, ZeroCapacityBecomesOne) {
    BroadcastChannel<int> channel(0);

    EXPECT_EQ(channel.capacity(), 1u);
}
