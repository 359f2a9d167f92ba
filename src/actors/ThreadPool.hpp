//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/ThreadPool.hpp
// Purpose: Declares the shared worker pool that runs actor activations.
// Key invariants: Tasks leave the queue in submission order; the first
//                 exception escaping a task is kept for waitIdle().
// Ownership/Lifetime: ThreadPool owns its worker threads and joins them in
//                     shutdown() or the destructor.
// Links: src/actors/ThreadPool.cpp, src/actors/Scheduler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Scheduler.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace strand::actors
{

/// @brief Fixed-size pool of worker threads executing tasks FIFO.
class ThreadPool final : public Scheduler
{
  public:
    /// @brief Start @p workers threads; 0 picks std::thread::hardware_concurrency().
    explicit ThreadPool(unsigned workers = 0);

    ~ThreadPool() override;

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /// @throws std::logic_error after shutdown().
    void submit(Task task) override;

    /// @brief Block until the queue is empty and every worker is idle.
    void waitIdle() override;

    /// @brief Stop accepting tasks, finish queued ones and join the workers.
    void shutdown() override;

    [[nodiscard]] size_t workerCount() const noexcept
    {
        return workers_.size();
    }

    [[nodiscard]] size_t pending() const;

    [[nodiscard]] size_t active() const;

  private:
    void workerLoop();

    mutable std::mutex mu_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    std::vector<std::thread> workers_;
    size_t active_ = 0;
    bool stopping_ = false;
    std::exception_ptr failure_;
};

} // namespace strand::actors
