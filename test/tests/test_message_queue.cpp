#include <gtest/gtest.h>
#include "logbeam.hpp"
#include "utils/test_utils.hpp"
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <atomic>

using namespace logbeam;

class MessageQueueTest : public ::testing::Test {
protected:
    static std::vector<std::string> drain(MessageQueue& queue) {
        std::vector<std::string> result;
        LogMessage message;
        while (queue.dequeue(message, 0)) {
            result.push_back(message.body());
        }
        return result;
    }
};

TEST_F(MessageQueueTest, FifoOrder) {
    MessageQueue queue(10, DiscardAction::Oldest);
    queue.enqueue(TestUtils::makeMessage("a"));
    queue.enqueue(TestUtils::makeMessage("b"));
    queue.enqueue(TestUtils::makeMessage("c"));

    EXPECT_EQ(queue.size(), 3u);
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(drain(queue), expected);
    EXPECT_TRUE(queue.isEmpty());
}

TEST_F(MessageQueueTest, DiscardOldestDropsHead) {
    MessageQueue queue(3, DiscardAction::Oldest);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(queue.enqueue(TestUtils::makeMessage(std::to_string(i))));
    }

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.discardCount(), 2u);
    std::vector<std::string> expected = {"2", "3", "4"};
    EXPECT_EQ(drain(queue), expected);
}

TEST_F(MessageQueueTest, DiscardNewestDropsIncoming) {
    MessageQueue queue(3, DiscardAction::Newest);
    for (int i = 0; i < 5; ++i) {
        queue.enqueue(TestUtils::makeMessage(std::to_string(i)));
    }

    EXPECT_EQ(queue.discardCount(), 2u);
    std::vector<std::string> expected = {"0", "1", "2"};
    EXPECT_EQ(drain(queue), expected);
}

TEST_F(MessageQueueTest, DiscardNoneStillBoundsQueue) {
    MessageQueue queue(2, DiscardAction::None);
    EXPECT_TRUE(queue.enqueue(TestUtils::makeMessage("a")));
    EXPECT_TRUE(queue.enqueue(TestUtils::makeMessage("b")));
    EXPECT_FALSE(queue.enqueue(TestUtils::makeMessage("c")));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.discardCount(), 1u);
}

TEST_F(MessageQueueTest, ZeroThresholdDiscardsEverything) {
    MessageQueue queue(0, DiscardAction::Oldest);
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(queue.enqueue(TestUtils::makeMessage("x")));
    }
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_EQ(queue.discardCount(), 4u);
}

TEST_F(MessageQueueTest, RequeueRestoresOrder) {
    MessageQueue queue(10, DiscardAction::Oldest);
    queue.enqueue(TestUtils::makeMessage("c"));

    // last first, as the writer does
    queue.requeue(TestUtils::makeMessage("b"));
    queue.requeue(TestUtils::makeMessage("a"));

    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(drain(queue), expected);
}

TEST_F(MessageQueueTest, RequeueAtCapacity) {
    MessageQueue oldest(2, DiscardAction::Oldest);
    oldest.enqueue(TestUtils::makeMessage("x"));
    oldest.enqueue(TestUtils::makeMessage("y"));
    EXPECT_FALSE(oldest.requeue(TestUtils::makeMessage("old")));
    EXPECT_EQ(oldest.size(), 2u);
    EXPECT_EQ(oldest.discardCount(), 1u);

    MessageQueue newest(2, DiscardAction::Newest);
    newest.enqueue(TestUtils::makeMessage("x"));
    newest.enqueue(TestUtils::makeMessage("y"));
    EXPECT_TRUE(newest.requeue(TestUtils::makeMessage("old")));
    std::vector<std::string> expected = {"old", "x"};
    EXPECT_EQ(drain(newest), expected);
    EXPECT_EQ(newest.discardCount(), 1u);
}

TEST_F(MessageQueueTest, LoweringThresholdTrimsQueue) {
    MessageQueue queue(10, DiscardAction::Oldest);
    for (int i = 0; i < 6; ++i) {
        queue.enqueue(TestUtils::makeMessage(std::to_string(i)));
    }

    queue.setDiscardThreshold(4);
    EXPECT_EQ(queue.size(), 4u);
    EXPECT_EQ(queue.discardCount(), 2u);
    EXPECT_EQ(queue.discardThreshold(), 4u);

    queue.setDiscardAction(DiscardAction::Newest);
    EXPECT_EQ(queue.discardAction(), DiscardAction::Newest);
    queue.setDiscardThreshold(3);

    std::vector<std::string> expected = {"2", "3", "4"};
    EXPECT_EQ(drain(queue), expected);
}

TEST_F(MessageQueueTest, DequeueTimesOut) {
    MessageQueue queue(10, DiscardAction::Oldest);
    LogMessage message;

    const std::int64_t start = detail::monotonicMillis();
    EXPECT_FALSE(queue.dequeue(message, 50));
    EXPECT_GE(detail::monotonicMillis() - start, 40);

    EXPECT_FALSE(queue.dequeue(message, 0));
}

TEST_F(MessageQueueTest, DequeueWakesOnEnqueue) {
    MessageQueue queue(10, DiscardAction::Oldest);
    std::atomic<bool> received(false);

    std::thread consumer([&] {
        LogMessage message;
        if (queue.dequeue(message, kWaitForever) && message.body() == "wake") {
            received.store(true);
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.enqueue(TestUtils::makeMessage("wake"));
    consumer.join();

    EXPECT_TRUE(received.load());
}

TEST_F(MessageQueueTest, InterruptReleasesBlockedConsumer) {
    MessageQueue queue(10, DiscardAction::Oldest);
    std::atomic<bool> returned(false);
    std::atomic<bool> result(true);

    std::thread consumer([&] {
        LogMessage message;
        result.store(queue.dequeue(message, kWaitForever));
        returned.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.interrupt();
    consumer.join();

    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(result.load());
}

TEST_F(MessageQueueTest, InterruptBeforeWaitIsNotLost) {
    MessageQueue queue(10, DiscardAction::Oldest);
    queue.interrupt();

    LogMessage message;
    EXPECT_FALSE(queue.dequeue(message, kWaitForever));

    // consumed: the next wait times out normally
    EXPECT_FALSE(queue.dequeue(message, 10));
}

TEST_F(MessageQueueTest, ConcurrentProducersRespectThreshold) {
    const size_t threshold = 100;
    MessageQueue queue(threshold, DiscardAction::Oldest);

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.push_back(std::thread([&queue, t] {
            for (int i = 0; i < 500; ++i) {
                queue.enqueue(TestUtils::makeMessage(std::to_string(t) + ":" + std::to_string(i)));
            }
        }));
    }
    for (size_t i = 0; i < producers.size(); ++i) producers[i].join();

    EXPECT_EQ(queue.size(), threshold);
    EXPECT_EQ(queue.discardCount(), 2000u - threshold);
}
