#include <gtest/gtest.h>
#include "thread_queue.h"
#include <thread>
#include <string>

using namespace std::chrono_literals;

TEST(ThreadQueueTest, PopReturnsItemsInOrder) {
    ThreadQueue<int> q;
    EXPECT_FALSE(q.pop().has_value());

    q.push(1);
    q.push(2);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 2);
    EXPECT_TRUE(q.empty());
}

TEST(ThreadQueueTest, WaitForAndPopTimesOut) {
    ThreadQueue<int> q;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.wait_for_and_pop(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(ThreadQueueTest, WaitForAndTakeSkipsNonMatching) {
    ThreadQueue<int> q;
    q.push(1);
    q.push(2);
    q.push(3);

    auto item = q.wait_for_and_take([](int v) { return v == 2; }, 10ms);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 2);

    // Unmatched items stay queued in order
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 3);
}

TEST(ThreadQueueTest, WaitForAndTakeWakesOnLaterPush) {
    ThreadQueue<std::string> q;

    std::thread producer([&q] {
        std::this_thread::sleep_for(30ms);
        q.push("other");
        std::this_thread::sleep_for(30ms);
        q.push("wanted");
    });

    auto item = q.wait_for_and_take([](const std::string& s) { return s == "wanted"; }, 2s);
    producer.join();

    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "wanted");
    EXPECT_EQ(q.pop(), "other");
}

TEST(ThreadQueueTest, TwoWaitersEachGetTheirOwnItem) {
    ThreadQueue<int> q;
    std::optional<int> got_a;
    std::optional<int> got_b;

    std::thread a([&] { got_a = q.wait_for_and_take([](int v) { return v == 10; }, 2s); });
    std::thread b([&] { got_b = q.wait_for_and_take([](int v) { return v == 20; }, 2s); });

    std::this_thread::sleep_for(20ms);
    q.push(20);
    q.push(10);

    a.join();
    b.join();

    EXPECT_EQ(got_a, 10);
    EXPECT_EQ(got_b, 20);
    EXPECT_TRUE(q.empty());
}

TEST(ThreadQueueTest, CloseWakesWaiters) {
    ThreadQueue<int> q;

    std::thread closer([&q] {
        std::this_thread::sleep_for(30ms);
        q.close();
    });

    auto start = std::chrono::steady_clock::now();
    auto item = q.wait_for_and_take([](int) { return true; }, 5s);
    closer.join();

    EXPECT_FALSE(item.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(q.is_closed());
}

TEST(ThreadQueueTest, ClosedQueueStillHandsOutQueuedItems) {
    ThreadQueue<int> q;
    q.push(7);
    q.close();

    EXPECT_EQ(q.wait_for_and_take([](int v) { return v == 7; }, 10ms), 7);
    EXPECT_FALSE(q.wait_for_and_pop(10ms).has_value());
}

TEST(ThreadQueueTest, RemoveIf) {
    ThreadQueue<int> q;
    for (int i = 0; i < 6; i++) {
        q.push(i);
    }

    EXPECT_EQ(q.remove_if([](int v) { return v % 2 == 0; }), 3u);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.pop(), 1);

    q.clear();
    EXPECT_TRUE(q.empty());
}
