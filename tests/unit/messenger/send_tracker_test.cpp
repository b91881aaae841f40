#include <gtest/gtest.h>

#include <docdrop/messenger/send_tracker.h>

#include <chrono>
#include <thread>

using namespace docdrop;
using namespace docdrop::messenger;
using std::chrono::milliseconds;

TEST(SendTrackerTest, ConfirmationBeforeWaitIsClaimed) {
    SendTracker tracker;
    tracker.succeeded(-1, 4096);
    auto id = tracker.await(-1, milliseconds(10));
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), 4096);
    EXPECT_EQ(tracker.unclaimed(), 0u);
}

TEST(SendTrackerTest, WaiterWakesOnConfirmationFromAnotherThread) {
    SendTracker tracker;
    std::thread receiver([&] {
        std::this_thread::sleep_for(milliseconds(20));
        tracker.succeeded(-7, 70);
    });
    auto id = tracker.await(-7, std::chrono::seconds(5));
    receiver.join();
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), 70);
}

TEST(SendTrackerTest, FailureIsReportedAsNetworkError) {
    SendTracker tracker;
    tracker.failed(-2, "CHAT_WRITE_FORBIDDEN (403)");
    auto id = tracker.await(-2, milliseconds(10));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::NetworkError);
    EXPECT_NE(id.error().message.find("CHAT_WRITE_FORBIDDEN"), std::string::npos);
    EXPECT_EQ(tracker.unclaimed(), 0u);
}

TEST(SendTrackerTest, LateOutcomesAfterTimeoutAreDropped) {
    SendTracker tracker;
    auto first = tracker.await(-3, milliseconds(5));
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().code, ErrorCode::Timeout);
    EXPECT_EQ(tracker.abandoned(), 1u);

    tracker.succeeded(-3, 300);
    EXPECT_EQ(tracker.unclaimed(), 0u);
    EXPECT_EQ(tracker.abandoned(), 0u);

    ASSERT_FALSE(tracker.await(-4, milliseconds(5)));
    tracker.failed(-4, "late");
    EXPECT_EQ(tracker.unclaimed(), 0u);
    EXPECT_EQ(tracker.abandoned(), 0u);
}
