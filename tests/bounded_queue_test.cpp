#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "engine/bounded_queue.hpp"

TEST(BoundedQueueTest, RejectsZeroCapacity)
{
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, PopsInFifoOrder)
{
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 2);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 3);
}

TEST(BoundedQueueTest, TimedPushFailsWhenFull)
{
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.push(1, 10));
    EXPECT_TRUE(queue.push(2, 10));
    EXPECT_FALSE(queue.push(3, 10));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(BoundedQueueTest, FailedTimedPushKeepsItem)
{
    BoundedQueue<std::string> queue(1);
    ASSERT_TRUE(queue.push(std::string("first"), 10));

    std::string item = "second";
    EXPECT_FALSE(queue.push(std::move(item), 10));
    EXPECT_EQ(item, "second");
}

TEST(BoundedQueueTest, PopTimesOutWhenEmpty)
{
    BoundedQueue<int> queue(1);
    int value = 0;
    EXPECT_FALSE(queue.pop(value, 10));
    EXPECT_FALSE(queue.isDrained());
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems)
{
    BoundedQueue<int> queue(3);
    queue.push(7);
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.push(8));
    EXPECT_FALSE(queue.isDrained());

    int value = 0;
    ASSERT_TRUE(queue.pop(value, 10));
    EXPECT_EQ(value, 7);
    EXPECT_FALSE(queue.pop(value, 10));
    EXPECT_TRUE(queue.isDrained());
}

TEST(BoundedQueueTest, CloseWakesBlockedProducer)
{
    BoundedQueue<int> queue(1);
    queue.push(1);

    std::atomic<bool> pushed{true};
    std::thread producer([&]()
                         { pushed = queue.push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_FALSE(pushed.load());
}

TEST(BoundedQueueTest, NeverExceedsCapacityUnderContention)
{
    const size_t capacity = 3;
    const int perProducer = 200;
    BoundedQueue<int> queue(capacity);

    std::atomic<size_t> maxSeen{0};
    std::atomic<int> consumed{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; p++)
    {
        producers.emplace_back([&]()
                               {
            for (int i = 0; i < perProducer; i++)
                queue.push(int(i)); });
    }

    std::thread consumer([&]()
                         {
        int value = 0;
        while (!queue.isDrained())
        {
            size_t size = queue.size();
            if (size > maxSeen)
                maxSeen = size;
            if (queue.pop(value, 10))
                consumed++;
        } });

    for (auto &producer : producers)
        producer.join();
    queue.close();
    consumer.join();

    EXPECT_EQ(consumed.load(), 4 * perProducer);
    EXPECT_LE(maxSeen.load(), capacity);
}
