#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../../src/engine/crawler/completion_tracker.hpp"

using namespace Arachne::Engine;

TEST(CompletionTrackerTest, DrainsOnLastDone) {
    int               fired = 0;
    CompletionTracker tracker(1, [&]() { fired++; });

    tracker.add(2);
    EXPECT_EQ(tracker.outstanding(), 3u);
    tracker.done();
    tracker.done();
    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(tracker.drained());

    tracker.done();
    EXPECT_EQ(fired, 1);
    EXPECT_TRUE(tracker.drained());
    EXPECT_EQ(tracker.outstanding(), 0u);
}

TEST(CompletionTrackerTest, ZeroInitialDrainsImmediately) {
    int               fired = 0;
    CompletionTracker tracker(0, [&]() { fired++; });
    EXPECT_EQ(fired, 1);
    tracker.wait();
}

TEST(CompletionTrackerTest, GuardSignalsOnScopeExit) {
    int               fired = 0;
    CompletionTracker tracker(1, [&]() { fired++; });
    {
        TaskGuard guard(tracker);
        EXPECT_EQ(fired, 0);
    }
    EXPECT_EQ(fired, 1);
}

TEST(CompletionTrackerTest, GuardSignalsWhenTaskThrows) {
    int               fired = 0;
    CompletionTracker tracker(1, [&]() { fired++; });
    try {
        TaskGuard guard(tracker);
        throw std::runtime_error("task failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(fired, 1);
}

// Each task registers its children before finishing, like a crawl tree.
TEST(CompletionTrackerTest, ConcurrentTreeFiresExactlyOnce) {
    std::atomic<int>  fired{0};
    CompletionTracker tracker(1, [&]() { fired++; });

    std::vector<std::thread> threads;
    std::mutex               threads_mutex;

    std::function<void(int)> task = [&](int depth) {
        TaskGuard guard(tracker);
        if (depth <= 0)
            return;
        for (int i = 0; i < 3; ++i) {
            tracker.add();
            std::lock_guard<std::mutex> lock(threads_mutex);
            threads.emplace_back(task, depth - 1);
        }
    };

    {
        std::lock_guard<std::mutex> lock(threads_mutex);
        threads.emplace_back(task, 4);
    }
    tracker.wait();

    // Threads keep being appended until the tree drains.
    std::lock_guard<std::mutex> lock(threads_mutex);
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(fired.load(), 1);
    EXPECT_EQ(threads.size(), 1u + 3u + 9u + 27u + 81u);
}
