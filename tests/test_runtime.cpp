/*-------------------------------------------------------------------------
 *
 * test_runtime.cpp
 *      Unit tests for the worker pool and cancellation tokens.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestUtil.hpp"
#include "runtime/CCancellationToken.hpp"
#include "runtime/CWorkerPool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

namespace StrataDB
{
namespace Test
{

TEST(WorkerPoolTest, ZeroThreadsStillRunsTasks)
{
    CWorkerPool pool(0);

    EXPECT_EQ(pool.threadCount(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, EveryTaskRuns)
{
    CWorkerPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;

    for (int i = 0; i < 100; i++)
        results.push_back(pool.submit([&counter, i] {
            counter++;
            return i * 2;
        }));

    for (int i = 0; i < 100; i++)
        EXPECT_EQ(results[i].get(), i * 2);
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, ExceptionsReachTheFuture)
{
    CWorkerPool pool(2);
    auto future = pool.submit([]() -> int {
        throw CCommandError(CErrorCode::BadValue, "bad");
    });

    EXPECT_TRUE(raisesCommandError([&] { future.get(); },
                                   CErrorCode::BadValue, "bad"));
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewWork)
{
    CWorkerPool pool(1);
    std::atomic<int> counter{0};

    for (int i = 0; i < 20; i++)
        pool.submit([&counter] { counter++; });

    pool.shutdown();
    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool.threadCount(), 0u);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);

    /* second shutdown is harmless */
    pool.shutdown();
}

TEST(CancellationTokenTest, CopiesShareState)
{
    CCancellationToken token;
    CCancellationToken copy = token;

    EXPECT_FALSE(copy.isCancelled());
    EXPECT_NO_THROW(copy.check());

    token.cancel();
    EXPECT_TRUE(copy.isCancelled());
    EXPECT_TRUE(raisesCommandError([&] { copy.check(); },
                                   CErrorCode::Interrupted,
                                   "operation was interrupted"));
}

TEST(CancellationTokenTest, IndependentTokens)
{
    CCancellationToken first;
    CCancellationToken second;

    first.cancel();
    EXPECT_FALSE(second.isCancelled());
}

} // namespace Test
} // namespace StrataDB
