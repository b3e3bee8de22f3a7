#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include "utils/thread_pool.hpp"

TEST(ThreadPoolTest, SubmitReturnsResult) {
    neo::ThreadPool pool(2);
    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, SubmitPropagatesExceptionsThroughFuture) {
    neo::ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitForAllDrainsQueue) {
    neo::ThreadPool pool(4);
    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.try_submit([&done] { ++done; }));
    }
    pool.wait_for_all();
    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.pending_tasks(), 0u);
    EXPECT_EQ(pool.active_tasks(), 0u);
}

TEST(ThreadPoolTest, BoundedQueueRefusesOverflow) {
    neo::ThreadPool pool(1, 1);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    ASSERT_TRUE(pool.try_submit([&started, gate] {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();

    EXPECT_TRUE(pool.try_submit([] {}));
    EXPECT_FALSE(pool.try_submit([] {}));
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);

    release.set_value();
    pool.wait_for_all();
}

TEST(ThreadPoolTest, FailingDetachedTaskDoesNotKillWorker) {
    neo::ThreadPool pool(1);
    ASSERT_TRUE(pool.try_submit([] { throw std::runtime_error("task failed"); }));
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, ShutdownRunsQueuedWorkThenRejects) {
    neo::ThreadPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.try_submit([&done] { ++done; });
    }
    pool.shutdown();

    EXPECT_EQ(done.load(), 10);
    EXPECT_FALSE(pool.is_running());
    EXPECT_FALSE(pool.try_submit([] {}));
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}
