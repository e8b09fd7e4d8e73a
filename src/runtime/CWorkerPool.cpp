/*-------------------------------------------------------------------------
 *
 * CWorkerPool.cpp
 *      Fixed-size pool of worker threads executing queued tasks.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "runtime/CWorkerPool.hpp"

namespace StrataDB
{

CWorkerPool::CWorkerPool(size_t threadCount)
{
    if (threadCount == 0)
        threadCount = 1;

    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; i++)
        workers_.emplace_back([this]() { workerLoop(); });
}

CWorkerPool::~CWorkerPool()
{
    shutdown();
}

void
CWorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stopping_ && workers_.empty())
            return;
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
}

size_t
CWorkerPool::threadCount() const noexcept
{
    return workers_.size();
}

size_t
CWorkerPool::activeCount() const noexcept
{
    return active_.load();
}

/*
 * workerLoop
 *		Run tasks until shutdown is requested and the queue is drained.
 *		Task exceptions are captured by the packaged_task.
 */
void
CWorkerPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            condition_.wait(lock,
                            [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty())
                return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        active_++;
        task();
        active_--;
    }
}

} // namespace StrataDB
