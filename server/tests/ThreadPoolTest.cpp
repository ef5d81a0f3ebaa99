#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

#include "threadpool/ThreadPool.hpp"

TEST(ThreadPoolTest, RunsEveryTaskBeforeShutdownReturns) {
    std::atomic<int> done{0};
    ThreadPool pool(4);

    for (int i = 0; i < 200; ++i) {
        pool.enqueue(Task(i, "test", [&done]() { done++; }));
    }
    pool.shutdown();

    EXPECT_EQ(done.load(), 200);
    EXPECT_EQ(pool.getPendingTaskCount(), 0u);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    ThreadPool pool(1);

    pool.enqueue(Task(1, "test", []() { throw std::runtime_error("boom"); }));
    pool.enqueue(Task(2, "test", [&done]() { done++; }));
    pool.shutdown();

    EXPECT_EQ(done.load(), 1);
}

TEST(ThreadPoolTest, EnqueueAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.enqueue(Task(1, "test", []() {})), std::runtime_error);
}

TEST(ThreadPoolTest, RejectsZeroWorkers) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}
