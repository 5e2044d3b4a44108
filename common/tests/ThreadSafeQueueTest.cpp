#include <gtest/gtest.h>
#include <ThreadSafeQueue.hpp>
#include <chrono>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
protected:
    ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, PushPop_FifoOrder) {
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
    EXPECT_TRUE(queue.isEmpty());
}

TEST_F(ThreadSafeQueueTest, Shutdown_RejectsPush_DrainsRemaining) {
    queue.push(7);
    queue.shutdown();

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.push(8));

    // Уже лежащий элемент ещё можно забрать
    EXPECT_EQ(queue.pop(), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(ThreadSafeQueueTest, PopFor_Timeout_ReturnsNullopt) {
    auto start = std::chrono::steady_clock::now();
    auto item = queue.popFor(std::chrono::milliseconds(20));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(item.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(15));
}

TEST_F(ThreadSafeQueueTest, Shutdown_WakesBlockedConsumer) {
    std::optional<int> result = 42;

    std::thread consumer([this, &result]() {
        result = queue.pop();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_FALSE(result.has_value());
}

TEST_F(ThreadSafeQueueTest, SingleProducerSingleConsumer_PreservesOrder) {
    const int COUNT = 1000;
    std::vector<int> received;

    std::thread consumer([this, &received]() {
        while (auto item = queue.pop()) {
            received.push_back(*item);
        }
    });

    for (int i = 0; i < COUNT; ++i) {
        queue.push(i);
    }
    queue.shutdown();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(COUNT));
    for (int i = 0; i < COUNT; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
