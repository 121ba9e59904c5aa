#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "harbor/jobs/cleanup_queue.h"

using harbor::jobs::CleanupQueue;

TEST(CleanupQueue, ShutdownDrainsQueuedIds) {
    std::mutex mutex;
    std::set<std::string> seen;
    CleanupQueue queue(8, 2, [&](const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(id);
        return harbor::core::Ok();
    });

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(queue.Enqueue("id-" + std::to_string(i)));
    }
    queue.Shutdown();

    EXPECT_EQ(seen.size(), 20u);
    EXPECT_EQ(queue.completed(), 20u);
    EXPECT_EQ(queue.failed(), 0u);
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_FALSE(queue.Enqueue("late"));
}

TEST(CleanupQueue, CountsFailures) {
    CleanupQueue queue(4, 1, [](const std::string& id) -> harbor::core::Result<void> {
        if (id == "bad") {
            return harbor::core::Error{harbor::core::ErrorCode::kIoError, "permission denied"};
        }
        return harbor::core::Ok();
    });

    ASSERT_TRUE(queue.Enqueue("good"));
    ASSERT_TRUE(queue.Enqueue("bad"));
    queue.Shutdown();

    EXPECT_EQ(queue.completed(), 1u);
    EXPECT_EQ(queue.failed(), 1u);
}

TEST(CleanupQueue, EnqueueBlocksWhileFull) {
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> running{0};

    CleanupQueue queue(1, 1, [&](const std::string&) {
        ++running;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return release; });
        return harbor::core::Ok();
    });

    // The worker holds "a"; "b" fills the single slot.
    ASSERT_TRUE(queue.Enqueue("a"));
    while (running.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_TRUE(queue.Enqueue("b"));

    std::atomic<bool> third_done{false};
    std::thread producer([&]() {
        queue.Enqueue("c");
        third_done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(third_done.load());
    EXPECT_EQ(queue.pending(), 1u);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    producer.join();
    EXPECT_TRUE(third_done.load());

    queue.Shutdown();
    EXPECT_EQ(queue.completed(), 3u);
}
