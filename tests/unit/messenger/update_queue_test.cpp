#include <gtest/gtest.h>

#include <docdrop/messenger/update_queue.h>

#include <chrono>
#include <thread>

using namespace docdrop::messenger;
using namespace std::chrono_literals;

namespace {
InboundUpdate withId(MessageId id) {
    InboundUpdate u;
    u.messageId = id;
    return u;
}
} // namespace

TEST(UpdateQueueTest, DeliversInArrivalOrder) {
    UpdateQueue q;
    EXPECT_TRUE(q.push(withId(1)));
    EXPECT_TRUE(q.push(withId(2)));
    EXPECT_EQ(q.size(), 2u);

    auto first = q.pop(10ms);
    auto second = q.tryPop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->messageId, 1);
    EXPECT_EQ(second->messageId, 2);
    EXPECT_FALSE(q.tryPop());
}

TEST(UpdateQueueTest, PopTimesOutWhenEmpty) {
    UpdateQueue q;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(UpdateQueueTest, CloseRejectsPushesButDrainsBacklog) {
    UpdateQueue q;
    ASSERT_TRUE(q.push(withId(1)));
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.push(withId(2)));

    auto drained = q.pop(1s);
    ASSERT_TRUE(drained);
    EXPECT_EQ(drained->messageId, 1);
    EXPECT_FALSE(q.pop(1s));
}

TEST(UpdateQueueTest, PushWakesWaitingConsumer) {
    UpdateQueue q;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        q.push(withId(9));
    });
    auto got = q.pop(5s);
    producer.join();
    ASSERT_TRUE(got);
    EXPECT_EQ(got->messageId, 9);
}

TEST(UpdateQueueTest, CloseWakesWaitingConsumer) {
    UpdateQueue q;
    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        q.close();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop(5s));
    closer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}
