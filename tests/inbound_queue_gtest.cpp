// GoogleTest unit tests for InboundQueue
#include "jframepp/InboundQueue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace jframepp;

TEST(InboundQueueTest, DrainReturnsInsertionOrder)
{
    InboundQueue<std::string> queue;
    queue.push("m1");
    queue.push("m2");
    queue.push("m3");
    EXPECT_EQ(queue.size(), 3u);

    const auto drained = queue.drain();
    EXPECT_EQ(drained, (std::vector<std::string>{"m1", "m2", "m3"}));
    EXPECT_TRUE(queue.empty());
}

TEST(InboundQueueTest, DrainOnEmptyQueueDoesNotBlock)
{
    InboundQueue<std::string> queue;
    EXPECT_TRUE(queue.drain().empty());
}

TEST(InboundQueueTest, DrainForTimesOutWhenEmpty)
{
    InboundQueue<int> queue;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(queue.drainFor(std::chrono::milliseconds(50)).empty());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
}

TEST(InboundQueueTest, DrainForWakesOnPush)
{
    InboundQueue<int> queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(7);
    });

    const auto drained = queue.drainFor(std::chrono::seconds(5));
    producer.join();
    ASSERT_EQ(drained.size(), 1u);
    EXPECT_EQ(drained[0], 7);
}

TEST(InboundQueueTest, SingleProducerOrderSurvivesConcurrentDrains)
{
    constexpr int Count = 10000;
    InboundQueue<int> queue;

    std::thread producer([&queue] {
        for (int i = 0; i < Count; ++i)
            queue.push(i);
    });

    std::vector<int> received;
    while (received.size() < static_cast<std::size_t>(Count))
    {
        for (const int v : queue.drainFor(std::chrono::milliseconds(10)))
            received.push_back(v);
    }
    producer.join();

    for (int i = 0; i < Count; ++i)
        ASSERT_EQ(received[static_cast<std::size_t>(i)], i);
}

TEST(InboundQueueTest, HoldsMoveOnlyEntries)
{
    InboundQueue<std::unique_ptr<int>> queue;
    queue.push(std::make_unique<int>(42));
    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 1u);
    EXPECT_EQ(*drained[0], 42);
}
