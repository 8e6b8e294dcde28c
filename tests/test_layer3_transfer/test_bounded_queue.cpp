// tests/test_layer3_transfer/test_bounded_queue.cpp
#include "bp_transfer.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace blkpipe::transfer;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, FifoOrder)
{
    BoundedQueue<int> q(4);
    for (int i = 0; i < 4; ++i)
        ASSERT_TRUE(q.push(i));
    EXPECT_EQ(q.size(), 4u);
    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(q.pop(), i);
}

TEST(BoundedQueueTest, ZeroCapacityThrows)
{
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, PushBlocksWhileFull)
{
    BoundedQueue<int> q(1);
    ASSERT_TRUE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer(
        [&]
        {
            EXPECT_TRUE(q.push(2));
            pushed = true;
        });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(q.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.pop(), 2);
}

TEST(BoundedQueueTest, CloseDrainsThenEnds)
{
    BoundedQueue<int> q(3);
    ASSERT_TRUE(q.push(7));
    ASSERT_TRUE(q.push(8));
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.push(9));
    EXPECT_EQ(q.pop(), 7);
    EXPECT_EQ(q.pop(), 8);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer)
{
    BoundedQueue<int> q(2);
    std::thread consumer([&] { EXPECT_FALSE(q.pop().has_value()); });
    std::this_thread::sleep_for(20ms);
    q.close();
    consumer.join();
}

TEST(BoundedQueueTest, CloseAndClearDropsItemsAndWakesProducer)
{
    BoundedQueue<int> q(2);
    ASSERT_TRUE(q.push(1));
    ASSERT_TRUE(q.push(2));

    std::thread producer([&] { EXPECT_FALSE(q.push(3)); });
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(q.close_and_clear(), 2u);
    producer.join();
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_EQ(q.size(), 0u);
}

TEST(BoundedQueueTest, ManyProducersManyConsumers)
{
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 1000;
    BoundedQueue<int> q(8);
    std::atomic<long> sum{0};
    std::atomic<int> count{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c)
    {
        consumers.emplace_back(
            [&]
            {
                while (auto v = q.pop())
                {
                    sum += *v;
                    ++count;
                }
            });
    }
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back(
            [&q, p]
            {
                for (int i = 0; i < kPerProducer; ++i)
                    q.push(p * kPerProducer + i);
            });
    }
    for (auto &t : producers)
        t.join();
    q.close();
    for (auto &t : consumers)
        t.join();

    const long n = kProducers * kPerProducer;
    EXPECT_EQ(count.load(), n);
    EXPECT_EQ(sum.load(), n * (n - 1) / 2);
}
