#include "memobuild/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <vector>

using namespace memobuild;

TEST(WorkerPool, RunsSubmittedTasks) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i)
        futures.push_back(pool.submit([i] { return i * i; }));
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(futures[i].get(), i * i);
}

TEST(WorkerPool, WaitIdleDrainsQueue) {
    std::atomic<int> done{0};
    WorkerPool pool(2);
    for (int i = 0; i < 50; ++i)
        pool.submit([&] { done++; });
    pool.wait_idle();
    EXPECT_EQ(done.load(), 50);
}

TEST(WorkerPool, DestructorFinishesQueuedWork) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 20; ++i)
            pool.submit([&] { done++; });
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(WorkerPool, ExceptionsTravelThroughFutures) {
    WorkerPool pool(1);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("bad"); });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(WorkerPool, ZeroMeansHardwareConcurrency) {
    WorkerPool pool(0);
    EXPECT_GE(pool.size(), 1u);
}
