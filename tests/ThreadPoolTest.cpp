#include "Thread/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>

TEST(ThreadPool, ReturnsTaskResults)
{
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i)
        futures.push_back(pool.enqueue([i] { return i * i; }));

    for (int i = 0; i < 32; ++i)
        EXPECT_EQ(futures[i].get(), i * i);
}

TEST(ThreadPool, ZeroPicksAtLeastOneWorker)
{
    ThreadPool pool;
    EXPECT_GE(pool.size(), 1u);
}

TEST(ThreadPool, ShutdownDrainsQueuedJobs)
{
    std::atomic<int> done{ 0 };
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 16; ++i)
            futures.push_back(pool.enqueue([&done] { ++done; }));
        pool.shutdown();
        EXPECT_EQ(pool.size(), 0u);
    }
    EXPECT_EQ(done.load(), 16);
    for (auto& f : futures)
        EXPECT_NO_THROW(f.get());
}

TEST(ThreadPool, EnqueueAfterShutdownThrows)
{
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.enqueue([] { return 1; }), std::runtime_error);
}

TEST(ThreadPool, ExceptionsTravelThroughTheFuture)
{
    ThreadPool pool(2);
    auto f = pool.enqueue([]() -> int { throw std::logic_error("boom"); });
    EXPECT_THROW(f.get(), std::logic_error);
}
