#include <gtest/gtest.h>
#include "utils/WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace FeedLine;

TEST(WorkerPoolTest, FutureCompletesAfterJob) {
    WorkerPool pool(2);
    std::atomic<bool> ran{false};
    std::future<void> done = pool.submit([&]() { ran = true; }, "flag");
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.maxThreads(), 1u);
}

TEST(WorkerPoolTest, ConcurrencyIsBounded) {
    WorkerPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(pool.submit([&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            g_usleep(20000);
            --running;
        }));
    }
    for (auto& f : futures) f.wait();
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), 2);
}

TEST(WorkerPoolTest, ThrowingJobStillCompletesFuture) {
    WorkerPool pool(1);
    std::future<void> done = pool.submit([]() { throw std::runtime_error("parse failure"); }, "thrower");
    EXPECT_NO_THROW(done.get());

    std::atomic<bool> after{false};
    pool.submit([&]() { after = true; }).wait();
    EXPECT_TRUE(after.load());
}

TEST(WorkerPoolTest, DestructorDrainsQueuedJobs) {
    std::atomic<int> finished{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&]() {
                g_usleep(5000);
                ++finished;
            });
        }
    }
    EXPECT_EQ(finished.load(), 5);
}
