#include "mclink/coroutine/coroutine.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace mclink::coro;

namespace
{
    auto square(int value) -> Task<int>
    {
        co_return value * value;
    }

    auto sumSquares(int count) -> Task<int>
    {
        auto total{ 0 };
        for (auto i{ 1 }; i <= count; ++i) {
            total += co_await square(i);
        }
        co_return total;
    }

    auto failing() -> Task<int>
    {
        throw std::runtime_error("boom");
        co_return 0;
    }

    auto drain(Channel<int>& channel) -> Task<int>
    {
        auto total{ 0 };
        while (auto value{ co_await channel.next() }) {
            total += *value;
        }
        co_return total;
    }
}

TEST(Coroutine, SyncWaitReturnsValue)
{
    EXPECT_EQ(syncWait(sumSquares(3)), 14);
}

TEST(Coroutine, SyncWaitRethrows)
{
    EXPECT_THROW(syncWait(failing()), std::runtime_error);
}

TEST(Coroutine, ChannelDeliversQueuedValuesBeforeClose)
{
    Channel<int> channel;
    channel.push(1);
    channel.push(2);
    channel.close();
    channel.push(100);

    EXPECT_EQ(syncWait(drain(channel)), 3);
}

TEST(Coroutine, ChannelWakesConsumerFromOtherThread)
{
    Channel<int> channel;
    std::jthread producer([&channel] {
        for (auto i{ 1 }; i <= 10; ++i) {
            channel.push(i);
        }
        channel.close();
    });

    EXPECT_EQ(syncWait(drain(channel)), 55);
    EXPECT_TRUE(channel.isClosed());
}
