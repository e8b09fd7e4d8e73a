/*-------------------------------------------------------------------------
 *
 * CWorkerPool.hpp
 *      Fixed-size pool of worker threads executing queued tasks.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace StrataDB
{

class CWorkerPool
{
  public:
    explicit CWorkerPool(size_t threadCount);
    ~CWorkerPool();

    CWorkerPool(const CWorkerPool&) = delete;
    CWorkerPool& operator=(const CWorkerPool&) = delete;

    /*
     * Queue a task; its result or exception is delivered through the
     * returned future. Throws std::runtime_error after shutdown().
     */
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>>
    {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(
            std::forward<F>(task));
        std::future<Result> future = packaged->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (stopping_)
                throw std::runtime_error("worker pool is shut down");
            tasks_.emplace([packaged]() { (*packaged)(); });
        }
        condition_.notify_one();
        return future;
    }

    /* Finish queued tasks, then join every worker */
    void shutdown();

    size_t threadCount() const noexcept;
    size_t activeCount() const noexcept;

  private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
    std::atomic<size_t> active_{0};
};

} // namespace StrataDB
