#include "skyup/core/channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using skyup::Channel;

TEST(ChannelTest, PushAndPop) {
    Channel<int> channel;
    channel.push(42);
    channel.push(100);

    auto first = channel.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = channel.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ChannelTest, TryPopOnEmpty) {
    Channel<int> channel;
    EXPECT_FALSE(channel.try_pop().has_value());

    channel.push(7);
    auto value = channel.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);
}

TEST(ChannelTest, PopForTimesOut) {
    Channel<int> channel;

    auto start = std::chrono::steady_clock::now();
    auto value = channel.pop_for(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed.count(), 40);
}

TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> channel;
    channel.push(1);
    channel.push(2);
    channel.close();
    channel.push(3);  // dropped

    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.pop().value(), 1);
    EXPECT_EQ(channel.pop().value(), 2);
    EXPECT_FALSE(channel.pop().has_value());
}

TEST(ChannelTest, CloseWakesBlockedReader) {
    Channel<int> channel;
    std::vector<int> received;
    std::thread reader([&]() {
        while (auto value = channel.pop()) {
            received.push_back(*value);
        }
    });

    for (int i = 0; i < 100; ++i) {
        channel.push(i);
    }
    channel.close();
    reader.join();

    ASSERT_EQ(received.size(), 100u);
    EXPECT_EQ(received.front(), 0);
    EXPECT_EQ(received.back(), 99);
}
