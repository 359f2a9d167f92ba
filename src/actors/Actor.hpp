//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Actor.hpp
// Purpose: Declares the actor: a strictly serialized mailbox whose turns run
//          on a shared scheduler.
// Key invariants:
//   - At most one turn of an actor is in flight: executing_ is set when an
//     activation is submitted and cleared only by that activation once the
//     mailbox is empty.
//   - The mailbox is FIFO; send() appends at the tail, turns take the head.
//   - After tearDown() every send() throws ActorTornDownError.
//   - Lock order: actor mutex before any scheduler, session or breakpoint
//     mutex; the actor mutex is never held while a turn executes.
// Ownership/Lifetime: Actors are always owned by std::shared_ptr; a pending
//                     activation keeps its actor alive.
// Links: src/actors/Actor.cpp, src/debug/DebugActor.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/EventualMessage.hpp"
#include "actors/Promise.hpp"
#include "support/source_location.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace strand::actors
{

class Interpreter;
class Scheduler;
class TraceSink;

/// @brief Collaborators shared by every actor of a runtime.
struct ActorContext
{
    Scheduler *scheduler = nullptr;       ///< Runs activations; required.
    Interpreter *interpreter = nullptr;   ///< Executes method bodies; required.
    TraceSink *trace = nullptr;           ///< Optional turn tracing.
    HaltListener *haltListener = nullptr; ///< Receives resolver halts raised in turns.
    uint32_t turnsPerActivation = 64;     ///< Turns drained before yielding the worker.
};

/// @brief Unit of isolation with its own serialized message queue.
class Actor : public std::enable_shared_from_this<Actor>
{
  public:
    /// @throws std::invalid_argument when the scheduler or interpreter is missing.
    Actor(ActorContext ctx, std::string name);
    virtual ~Actor() = default;

    Actor(const Actor &) = delete;
    Actor &operator=(const Actor &) = delete;

    static std::shared_ptr<Actor> create(ActorContext ctx, std::string name);

    [[nodiscard]] uint64_t id() const noexcept
    {
        return id_;
    }

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

    [[nodiscard]] const ActorContext &context() const noexcept
    {
        return ctx_;
    }

    /// @brief Schedule @p msg onto this actor.
    /// @throws ActorTornDownError after tearDown().
    /// @throws std::invalid_argument when @p msg targets another actor.
    void send(MessageRef msg);

    /// @brief Dequeue the mailbox head, or null when the mailbox is empty.
    MessageRef takeNext();

    /// @brief Retire the mailbox; pending messages are discarded.
    void tearDown();

    [[nodiscard]] bool isTornDown() const;

    [[nodiscard]] size_t mailboxSize() const;

    /// @brief True while an activation is queued or running.
    [[nodiscard]] bool isExecuting() const;

    [[nodiscard]] uint64_t completedTurns() const noexcept
    {
        return completedTurns_.load(std::memory_order_acquire);
    }

    /// @brief Actor whose turn the calling thread is executing, or null.
    static Actor *current() noexcept;

    /// @brief Whether a message created at @p callSite by this actor must
    ///        install a future breakpoint.
    virtual bool hasSenderBreakpoint(const support::SourceLocation &callSite) const;

  protected:
    /// @brief Delivery decision for an incoming message; mu_ is held.
    virtual void scheduleLocked(MessageRef msg);

    /// @brief Turn-completion hook; mu_ is held.
    virtual void leaveLocked(const EventualMessage &msg);

    /// @brief Extra teardown work; mu_ is held.
    virtual void onTearDownLocked();

    /// @brief Append @p msg to the mailbox and wake the actor if idle.
    void appendToMailboxLocked(MessageRef msg);

    bool isTornDownLocked() const noexcept
    {
        return tornDown_;
    }

    mutable std::mutex mu_;

  private:
    void activateLocked();
    void processMailbox();
    void executeTurn(const MessageRef &msg);

    const uint64_t id_;
    const std::string name_;
    const ActorContext ctx_;

    std::deque<MessageRef> mailbox_;
    bool executing_ = false;
    bool tornDown_ = false;
    std::atomic<uint64_t> completedTurns_{0};
};

} // namespace strand::actors
