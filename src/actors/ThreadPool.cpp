//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/ThreadPool.cpp
// Purpose: Implements the shared worker pool that runs actor activations.
// Key invariants: active_ counts tasks that left the queue and have not yet
//                 returned; the pool is idle when the queue is empty and
//                 active_ is zero.
// Ownership/Lifetime: Queued tasks are destroyed by the worker that ran them.
// Links: src/actors/ThreadPool.hpp
//
//===----------------------------------------------------------------------===//

#include "actors/ThreadPool.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace strand::actors
{

ThreadPool::ThreadPool(unsigned workers)
{
    if (workers == 0)
        workers = std::max(1u, std::thread::hardware_concurrency());
    workers_.reserve(workers);
    for (unsigned i = 0; i < workers; ++i)
        workers_.emplace_back([this] { workerLoop(); });
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_)
            throw std::logic_error("ThreadPool: submit after shutdown");
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
}

void ThreadPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(mu_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    if (failure_)
    {
        std::exception_ptr failure = std::exchange(failure_, nullptr);
        std::rethrow_exception(failure);
    }
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_ && workers_.empty())
            return;
        stopping_ = true;
    }
    workAvailable_.notify_all();
    for (auto &worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
}

size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

size_t ThreadPool::active() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return active_;
}

/// @brief Pull tasks until shutdown drains the queue.
///
/// @details A task that throws does not take its worker down: the exception
///          is kept for the next waitIdle() caller, later ones are dropped
///          in favour of the first.
void ThreadPool::workerLoop()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        std::exception_ptr failure;
        try
        {
            task();
        }
        catch (...)
        {
            failure = std::current_exception();
        }
        task = nullptr;

        bool nowIdle = false;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (failure && !failure_)
                failure_ = failure;
            --active_;
            nowIdle = queue_.empty() && active_ == 0;
        }
        if (nowIdle)
            idle_.notify_all();
    }
}

} // namespace strand::actors
