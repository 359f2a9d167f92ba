//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Actor.cpp
// Purpose: Implements mailbox delivery, activations and the turn loop.
// Key invariants: See Actor.hpp.
// Ownership/Lifetime: An activation task captures a shared_ptr to its actor.
// Links: src/actors/Actor.hpp, src/actors/Scheduler.hpp
//
//===----------------------------------------------------------------------===//

#include "actors/Actor.hpp"

#include "actors/Errors.hpp"
#include "actors/Interpreter.hpp"
#include "actors/Scheduler.hpp"
#include "actors/Trace.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace strand::actors
{
namespace
{
std::atomic<uint64_t> nextActorId{1};

thread_local Actor *tlsCurrentActor = nullptr;

/// Binds the executing actor to the worker thread for one turn.
class CurrentActorScope
{
  public:
    explicit CurrentActorScope(Actor *actor) : previous_(tlsCurrentActor)
    {
        tlsCurrentActor = actor;
    }

    ~CurrentActorScope()
    {
        tlsCurrentActor = previous_;
    }

    CurrentActorScope(const CurrentActorScope &) = delete;
    CurrentActorScope &operator=(const CurrentActorScope &) = delete;

  private:
    Actor *previous_;
};

} // namespace

Actor::Actor(ActorContext ctx, std::string name)
    : id_(nextActorId.fetch_add(1, std::memory_order_relaxed)), name_(std::move(name)), ctx_(ctx)
{
    if (!ctx_.scheduler)
        throw std::invalid_argument("Actor '" + name_ + "': missing scheduler");
    if (!ctx_.interpreter)
        throw std::invalid_argument("Actor '" + name_ + "': missing interpreter");
}

std::shared_ptr<Actor> Actor::create(ActorContext ctx, std::string name)
{
    return std::make_shared<Actor>(ctx, std::move(name));
}

Actor *Actor::current() noexcept
{
    return tlsCurrentActor;
}

void Actor::send(MessageRef msg)
{
    if (!msg)
        throw std::invalid_argument("Actor::send: null message");
    if (msg->target() != this)
        throw std::invalid_argument("Actor::send: message #" + std::to_string(msg->id()) +
                                    " is addressed to another actor");
    if (!msg->isBound())
        throw std::invalid_argument("Actor::send: message #" + std::to_string(msg->id()) +
                                    " still waits for its promise");
    std::lock_guard<std::mutex> lock(mu_);
    if (tornDown_)
        throw ActorTornDownError(id_);
    scheduleLocked(std::move(msg));
}

MessageRef Actor::takeNext()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (mailbox_.empty())
        return nullptr;
    MessageRef msg = std::move(mailbox_.front());
    mailbox_.pop_front();
    return msg;
}

void Actor::tearDown()
{
    std::lock_guard<std::mutex> lock(mu_);
    tornDown_ = true;
    mailbox_.clear();
    onTearDownLocked();
}

bool Actor::isTornDown() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return tornDown_;
}

size_t Actor::mailboxSize() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return mailbox_.size();
}

bool Actor::isExecuting() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return executing_;
}

bool Actor::hasSenderBreakpoint(const support::SourceLocation &) const
{
    return false;
}

void Actor::scheduleLocked(MessageRef msg)
{
    appendToMailboxLocked(std::move(msg));
}

void Actor::leaveLocked(const EventualMessage &) {}

void Actor::onTearDownLocked() {}

void Actor::appendToMailboxLocked(MessageRef msg)
{
    mailbox_.push_back(std::move(msg));
    if (!executing_)
        activateLocked();
}

void Actor::activateLocked()
{
    executing_ = true;
    try
    {
        ctx_.scheduler->submit([self = shared_from_this()] { self->processMailbox(); });
    }
    catch (...)
    {
        executing_ = false;
        throw;
    }
}

/// @brief Body of one activation.
///
/// @details Drains up to turnsPerActivation messages, then hands the worker
///          back by submitting a fresh activation.  executing_ stays set across
///          that hand-off so no second activation can start in between.  If a
///          turn throws, the completion hook still runs and the actor is
///          reactivated for the remaining messages before the exception
///          reaches the scheduler.
void Actor::processMailbox()
{
    const uint32_t budget = std::max<uint32_t>(1, ctx_.turnsPerActivation);
    for (uint32_t done = 0;; ++done)
    {
        MessageRef msg;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (tornDown_ || mailbox_.empty())
            {
                executing_ = false;
                return;
            }
            if (done == budget)
            {
                activateLocked();
                return;
            }
            msg = std::move(mailbox_.front());
            mailbox_.pop_front();
        }

        std::exception_ptr failure;
        try
        {
            executeTurn(msg);
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        completedTurns_.fetch_add(1, std::memory_order_acq_rel);
        if (!failure)
        {
            std::lock_guard<std::mutex> lock(mu_);
            leaveLocked(*msg);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mu_);
            leaveLocked(*msg);
            if (!tornDown_ && !mailbox_.empty())
                activateLocked();
            else
                executing_ = false;
        }
        std::rethrow_exception(failure);
    }
}

/// @brief Run one message and resolve its promise.
///
/// @details Dependent messages whose resolution they do not react to forward
///          it unchanged.  A RuntimeSignal becomes the Error outcome carrying
///          its payload; a protocol violation raised by the method body is
///          recorded the same way with its message text.
void Actor::executeTurn(const MessageRef &msg)
{
    CurrentActorScope scope(this);

    Value result;
    Outcome outcome = Outcome::Success;
    if (!msg->shouldInvoke())
    {
        result = msg->forwardedValue();
        outcome = msg->forwardedOutcome();
    }
    else
    {
        try
        {
            result = ctx_.interpreter->invoke(msg->receiver(), msg->selector(), msg->arguments(), *this);
        }
        catch (const RuntimeSignal &sig)
        {
            result = sig.payload();
            outcome = Outcome::Error;
        }
        catch (const ProtocolError &err)
        {
            result = std::string(err.what());
            outcome = Outcome::Error;
        }
    }

    if (ctx_.trace)
        ctx_.trace->onTurn(*this, *msg, outcome, result);
    if (msg->resolver())
        resolve(*msg->resolver(), std::move(result), outcome, false, false, ctx_.haltListener);
}

} // namespace strand::actors
