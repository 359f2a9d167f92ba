//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Scheduler.hpp
// Purpose: Declares the task sink actors submit their activations to.
// Key invariants:
//   - Tasks are started in submission order.
//   - An exception escaping a task is captured, never lost; waitIdle()
//     rethrows the first one.
// Ownership/Lifetime: Implementations own their queued tasks.
// Links: src/actors/ThreadPool.hpp, src/actors/Actor.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>

namespace strand::actors
{

/// @brief Destination for actor activations.
class Scheduler
{
  public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /// @brief Queue @p task for execution on some worker.
    virtual void submit(Task task) = 0;

    /// @brief Block until no task is queued or running.
    /// @throws The first exception that escaped a task since the last call.
    virtual void waitIdle() = 0;

    /// @brief Stop accepting tasks; tasks already queued still run.
    virtual void shutdown() = 0;
};

} // namespace strand::actors
