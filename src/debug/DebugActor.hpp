//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugActor.hpp
// Purpose: Declare the actor variant that can be paused, stepped and stopped
//          at message breakpoints.
// Key invariants:
//   - pausedState != Initial implies debuggingState == Paused once attached.
//   - Inbox and mailbox are disjoint; a message is in at most one of them.
//   - The inbox is FIFO; a released message that must wait again returns to
//     its head.
//   - Breakpoint maps have their own leaf mutex so sender-side lookups from
//     another actor's delivery path never take this actor's main lock.
// Ownership/Lifetime: Created through create(), which registers the actor with
//                     its session.  The session is held weakly; once it is
//                     gone the actor stops recording and matches no
//                     breakpoint.
// Links: src/debug/DebugActor.cpp, src/debug/DebugSession.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Actor.hpp"
#include "debug/Breakpoint.hpp"
#include "debug/DebugSession.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace strand::debug
{

/// @brief Whether the debugger controls the actor right now.
enum class DebuggingState : uint8_t
{
    Initial, ///< No debugger attached yet; deliveries are buffered.
    Running, ///< Attached and delivering normally.
    Paused,  ///< Stopped; see PausedState for the reason.
};

/// @brief Why a paused actor stopped, or which step it is running.
enum class PausedState : uint8_t
{
    Initial,
    Command,
    Breakpoint,
    StepInto,
    StepOver,
    StepReturn,
};

std::string_view toString(DebuggingState s) noexcept;
std::string_view toString(PausedState s) noexcept;

/// @brief Actor with the pause/step state machine in its delivery path.
class DebugActor final : public actors::Actor
{
  public:
    DebugActor(actors::ActorContext ctx, std::string name, std::shared_ptr<DebugSession> session);
    ~DebugActor() override;

    /// @brief Create an actor and register it with @p session.
    /// @throws std::invalid_argument when @p session is null.
    static std::shared_ptr<DebugActor> create(actors::ActorContext ctx,
                                              std::string name,
                                              const std::shared_ptr<DebugSession> &session);

    /// @brief Owning handle to the session, or null once it is gone.
    std::shared_ptr<DebugSession> session() const noexcept
    {
        return session_.lock();
    }

    /// @brief Initial -> Running; buffered messages stay in the inbox.
    void attach();

    /// @brief Stop delivering: Paused/Command from any state.
    void pause();

    /// @brief Leave Paused and redeliver the inbox in order.
    /// @return False (and no effect) when the actor is not paused.
    bool resume();

    void stepInto();
    void stepOver();
    void stepReturn();

    /// @brief Pause because a resolution in the current turn halted.
    void haltAtBreakpoint();

    /// @throws std::logic_error when the session is gone.
    BreakpointRef addBreakpoint(const support::SourceLocation &loc, BreakpointSide side);
    bool removeBreakpoint(const support::SourceLocation &loc, BreakpointSide side);

    /// @brief Whether an enabled breakpoint of @p side is installed at @p loc.
    bool isBreakpointed(const support::SourceLocation &loc, BreakpointSide side) const;

    bool hasSenderBreakpoint(const support::SourceLocation &callSite) const override;

    bool isStarted() const;
    bool isPaused() const;
    bool isPausedByBreakpoint() const;
    bool isInStepInto() const;
    bool isInStepOver() const;
    bool isInStepReturn() const;
    DebuggingState debuggingState() const;
    PausedState pausedState() const;
    size_t inboxSize() const;

  protected:
    void scheduleLocked(actors::MessageRef msg) override;
    void leaveLocked(const actors::EventualMessage &msg) override;
    void onTearDownLocked() override;

  private:
    using BreakpointMap = std::unordered_map<support::SourceLocation, BreakpointRef, support::SourceLocationHash>;

    void deliverLocked(actors::MessageRef msg, bool released);
    void bufferLocked(actors::MessageRef msg, bool released);
    void appendLocked(actors::MessageRef msg);
    void pauseLocked(PausedState why, const actors::EventualMessage *msg);
    void installFutureBreakpointLocked(const actors::EventualMessage &msg);
    void stepLocked(PausedState step);
    void recordLocked(DebugEventKind kind, const actors::EventualMessage *msg);

    BreakpointMap &mapFor(BreakpointSide side)
    {
        return side == BreakpointSide::Sender ? senderBreakpoints_ : receiverBreakpoints_;
    }

    const BreakpointMap &mapFor(BreakpointSide side) const
    {
        return side == BreakpointSide::Sender ? senderBreakpoints_ : receiverBreakpoints_;
    }

    std::weak_ptr<DebugSession> session_;

    // Guarded by Actor::mu_.
    DebuggingState debuggingState_ = DebuggingState::Initial;
    PausedState pausedState_ = PausedState::Initial;
    std::deque<actors::MessageRef> inbox_;

    mutable std::mutex bpMu_;
    BreakpointMap receiverBreakpoints_;
    BreakpointMap senderBreakpoints_;
};

} // namespace strand::debug
