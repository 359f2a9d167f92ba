//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugActor.cpp
// Purpose: Implement the pause/step state machine that sits between message
//          delivery and the mailbox.
// Key invariants:
//   - Every decision runs under Actor::mu_; breakpoint maps are read under
//     the leaf bpMu_ only.
//   - A message reports its own receiver-breakpoint hit at most once, so a
//     released message always makes progress.
// Ownership/Lifetime: Buffered messages are owned by the inbox until released
//                     or discarded by tearDown().
// Links: src/debug/DebugActor.hpp
//
//===----------------------------------------------------------------------===//

#include "debug/DebugActor.hpp"

#include "actors/Trace.hpp"

#include <stdexcept>
#include <utility>

namespace strand::debug
{

using actors::EventualMessage;
using actors::MessageRef;

std::string_view toString(DebuggingState s) noexcept
{
    switch (s)
    {
        case DebuggingState::Initial:
            return "initial";
        case DebuggingState::Running:
            return "running";
        case DebuggingState::Paused:
            return "paused";
    }
    return "unknown";
}

std::string_view toString(PausedState s) noexcept
{
    switch (s)
    {
        case PausedState::Initial:
            return "initial";
        case PausedState::Command:
            return "command";
        case PausedState::Breakpoint:
            return "breakpoint";
        case PausedState::StepInto:
            return "step-into";
        case PausedState::StepOver:
            return "step-over";
        case PausedState::StepReturn:
            return "step-return";
    }
    return "unknown";
}

DebugActor::DebugActor(actors::ActorContext ctx, std::string name, std::shared_ptr<DebugSession> session)
    : Actor(ctx, std::move(name)), session_(std::move(session))
{
}

DebugActor::~DebugActor()
{
    if (auto session = session_.lock())
        session->unregisterActor(id());
}

std::shared_ptr<DebugActor> DebugActor::create(actors::ActorContext ctx,
                                               std::string name,
                                               const std::shared_ptr<DebugSession> &session)
{
    if (!session)
        throw std::invalid_argument("DebugActor '" + name + "': missing session");
    auto actor = std::make_shared<DebugActor>(ctx, std::move(name), session);
    session->registerActor(actor);
    return actor;
}

/// @details The trace sink belongs to the runtime that owns the session, so
///          neither is touched once the actor is torn down or the session is
///          gone.
void DebugActor::recordLocked(DebugEventKind kind, const EventualMessage *msg)
{
    if (isTornDownLocked())
        return;
    auto session = session_.lock();
    if (!session)
        return;
    session->record({kind, id(), msg ? msg->id() : 0, msg ? msg->callSite() : support::SourceLocation{}});
    if (auto *trace = context().trace)
        trace->onDebug(*this, toString(kind), msg ? msg->id() : 0);
}

void DebugActor::attach()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (debuggingState_ != DebuggingState::Initial)
        return;
    debuggingState_ = DebuggingState::Running;
    recordLocked(DebugEventKind::ActorAttached, nullptr);
}

void DebugActor::pause()
{
    std::lock_guard<std::mutex> lock(mu_);
    pauseLocked(PausedState::Command, nullptr);
}

/// @brief Return to Running and replay the inbox through the delivery path.
///
/// @details Draining stops as soon as a replayed message pauses the actor
///          again; that message is back at the inbox head and the rest keep
///          their order behind it.
bool DebugActor::resume()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (debuggingState_ != DebuggingState::Paused)
        return false;
    debuggingState_ = DebuggingState::Running;
    pausedState_ = PausedState::Initial;
    recordLocked(DebugEventKind::ActorResumed, nullptr);

    while (!inbox_.empty() && debuggingState_ == DebuggingState::Running)
    {
        MessageRef msg = std::move(inbox_.front());
        inbox_.pop_front();
        deliverLocked(std::move(msg), true);
    }
    return true;
}

void DebugActor::stepInto()
{
    std::lock_guard<std::mutex> lock(mu_);
    stepLocked(PausedState::StepInto);
}

void DebugActor::stepOver()
{
    std::lock_guard<std::mutex> lock(mu_);
    stepLocked(PausedState::StepOver);
}

void DebugActor::stepReturn()
{
    std::lock_guard<std::mutex> lock(mu_);
    stepLocked(PausedState::StepReturn);
}

/// @brief Arm a step and release exactly one buffered message.
/// @details The substate only changes while paused.  The inbox head is
///          released in every state, which is how messages buffered before
///          attach() reach the mailbox.
void DebugActor::stepLocked(PausedState step)
{
    if (debuggingState_ == DebuggingState::Paused)
        pausedState_ = step;
    if (inbox_.empty())
        return;
    MessageRef msg = std::move(inbox_.front());
    inbox_.pop_front();
    deliverLocked(std::move(msg), true);
}

void DebugActor::haltAtBreakpoint()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (debuggingState_ == DebuggingState::Initial)
        return;
    pauseLocked(PausedState::Breakpoint, nullptr);
}

BreakpointRef DebugActor::addBreakpoint(const support::SourceLocation &loc, BreakpointSide side)
{
    auto session = session_.lock();
    if (!session)
        throw std::logic_error("DebugActor '" + name() + "': session is gone");
    BreakpointRef bp = session->breakpoints().getOrCreate(loc, side);
    std::lock_guard<std::mutex> lock(bpMu_);
    mapFor(side)[loc] = bp;
    return bp;
}

bool DebugActor::removeBreakpoint(const support::SourceLocation &loc, BreakpointSide side)
{
    std::lock_guard<std::mutex> lock(bpMu_);
    return mapFor(side).erase(loc) != 0;
}

bool DebugActor::isBreakpointed(const support::SourceLocation &loc, BreakpointSide side) const
{
    BreakpointRef bp;
    {
        std::lock_guard<std::mutex> lock(bpMu_);
        const auto &map = mapFor(side);
        auto it = map.find(loc);
        if (it == map.end())
            return false;
        bp = it->second;
    }
    auto session = session_.lock();
    return session && session->breakpoints().isEnabled(*bp);
}

bool DebugActor::hasSenderBreakpoint(const support::SourceLocation &callSite) const
{
    return isBreakpointed(callSite, BreakpointSide::Sender);
}

bool DebugActor::isStarted() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return debuggingState_ != DebuggingState::Initial;
}

bool DebugActor::isPaused() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return debuggingState_ == DebuggingState::Paused;
}

bool DebugActor::isPausedByBreakpoint() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return debuggingState_ == DebuggingState::Paused && pausedState_ == PausedState::Breakpoint;
}

bool DebugActor::isInStepInto() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pausedState_ == PausedState::StepInto;
}

bool DebugActor::isInStepOver() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pausedState_ == PausedState::StepOver;
}

bool DebugActor::isInStepReturn() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pausedState_ == PausedState::StepReturn;
}

DebuggingState DebugActor::debuggingState() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return debuggingState_;
}

PausedState DebugActor::pausedState() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pausedState_;
}

size_t DebugActor::inboxSize() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return inbox_.size();
}

void DebugActor::scheduleLocked(MessageRef msg)
{
    deliverLocked(std::move(msg), false);
}

/// @brief Route one incoming or released message.
///
/// @details Before attach everything waits in the inbox.  While paused, an
///          armed step lets messages through to the mailbox (StepReturn also
///          arms a future breakpoint on each); any other pause keeps them in
///          the inbox.  While running, a receiver breakpoint on the call site
///          or a message tagged by a halting resolution stops the actor with
///          the message buffered, and a sender breakpoint in the sending actor
///          defers the stop to the resolution of the message's promise.
void DebugActor::deliverLocked(MessageRef msg, bool released)
{
    if (released)
        recordLocked(DebugEventKind::MessageReleased, msg.get());

    switch (debuggingState_)
    {
        case DebuggingState::Initial:
            bufferLocked(std::move(msg), released);
            return;

        case DebuggingState::Paused:
            switch (pausedState_)
            {
                case PausedState::StepInto:
                case PausedState::StepOver:
                    appendLocked(std::move(msg));
                    return;
                case PausedState::StepReturn:
                    installFutureBreakpointLocked(*msg);
                    appendLocked(std::move(msg));
                    return;
                default:
                    bufferLocked(std::move(msg), released);
                    return;
            }

        case DebuggingState::Running:
            break;
    }

    const support::SourceLocation &site = msg->callSite();
    if (!msg->breakpointReported() && (msg->isPaused() || isBreakpointed(site, BreakpointSide::Receiver)))
    {
        msg->markBreakpointReported();
        recordLocked(DebugEventKind::BreakpointHit, msg.get());
        if (auto *trace = context().trace)
            trace->onBreak(this, msg->id(), site, msg->isPaused() ? "resolution" : "receiver");
        const EventualMessage *hit = msg.get();
        bufferLocked(std::move(msg), released);
        pauseLocked(PausedState::Breakpoint, hit);
        return;
    }

    if (auto sender = msg->lockSender(); sender && sender->hasSenderBreakpoint(site))
        installFutureBreakpointLocked(*msg);
    appendLocked(std::move(msg));
}

void DebugActor::bufferLocked(MessageRef msg, bool released)
{
    recordLocked(DebugEventKind::MessageBuffered, msg.get());
    if (released)
        inbox_.push_front(std::move(msg));
    else
        inbox_.push_back(std::move(msg));
}

void DebugActor::appendLocked(MessageRef msg)
{
    recordLocked(DebugEventKind::MessageAddedToMailbox, msg.get());
    appendToMailboxLocked(std::move(msg));
}

void DebugActor::pauseLocked(PausedState why, const EventualMessage *msg)
{
    debuggingState_ = DebuggingState::Paused;
    pausedState_ = why;
    recordLocked(DebugEventKind::ActorPaused, msg);
}

/// @brief Make the resolution of @p msg's promise stop its dependents.
void DebugActor::installFutureBreakpointLocked(const EventualMessage &msg)
{
    if (!msg.resolver())
        return;
    msg.resolver()->promise()->enableHaltOnResolution();
    recordLocked(DebugEventKind::FutureBreakpointInstalled, &msg);
}

void DebugActor::leaveLocked(const EventualMessage &)
{
    if (pausedState_ == PausedState::StepOver)
    {
        pausedState_ = PausedState::Initial;
        if (inbox_.empty())
            debuggingState_ = DebuggingState::Running;
    }
    else if (pausedState_ == PausedState::StepInto)
    {
        pausedState_ = PausedState::Initial;
        debuggingState_ = DebuggingState::Running;
    }
}

void DebugActor::onTearDownLocked()
{
    inbox_.clear();
}

} // namespace strand::debug
