//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/EventualMessage.hpp
// Purpose: Declares the envelope of a pending asynchronous send.
// Key invariants:
//   - Selector, call site, sender and resolver never change after creation.
//   - A dependent message (PromiseSend / PromiseCallback) is bound to the
//     resolved value exactly once, before it is handed to its target.
//   - The paused flag is sticky.
//   - After enqueue only the target actor's scheduler touches the message.
// Ownership/Lifetime: Messages are shared between the sender, the promise
//                     they depend on and the target's queues; the target is
//                     kept alive by the message, the sender is held weakly.
// Links: src/actors/EventualMessage.cpp, src/actors/Actor.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Promise.hpp"
#include "actors/Value.hpp"
#include "support/source_location.hpp"
#include "support/symbol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace strand::actors
{

/// @brief Shape of an eventual send.
enum class MessageKind : uint8_t
{
    Direct,          ///< Send to an object inside a known actor.
    PromiseSend,     ///< Send pipelined on a promise; the value is the receiver.
    PromiseCallback, ///< Block registered on a promise; the value is the argument.
};

/// @brief Which resolutions a callback block reacts to.
enum class CallbackKind : uint8_t
{
    WhenResolved, ///< Runs on successful resolution.
    OnError,      ///< Runs on erroneous resolution.
};

/// @brief Immutable envelope describing one pending asynchronous send.
class EventualMessage
{
  public:
    /// @brief Send @p selector to @p receiver inside @p target.
    static MessageRef direct(ActorRef target,
                             Actor *sender,
                             Value receiver,
                             support::Symbol selector,
                             std::vector<Value> arguments,
                             ResolverRef resolver,
                             support::SourceLocation callSite);

    /// @brief Send @p selector to whatever value a promise resolves to.
    /// @details Register the message with addDependent().  When the value is a
    ///          far reference the send executes in its owner; otherwise it
    ///          executes in the promise's owner, falling back to @p sender.
    static MessageRef promiseSend(Actor *sender,
                                  support::Symbol selector,
                                  std::vector<Value> arguments,
                                  ResolverRef resolver,
                                  support::SourceLocation callSite);

    /// @brief Invoke @p block with the resolved value inside @p registrar.
    static MessageRef callback(ActorRef registrar,
                               Value block,
                               support::Symbol selector,
                               CallbackKind kind,
                               ResolverRef resolver,
                               support::SourceLocation callSite);

    EventualMessage(const EventualMessage &) = delete;
    EventualMessage &operator=(const EventualMessage &) = delete;

    [[nodiscard]] uint64_t id() const noexcept
    {
        return id_;
    }

    [[nodiscard]] MessageKind kind() const noexcept
    {
        return kind_;
    }

    /// @brief Target actor; null for a dependent message not yet bound.
    [[nodiscard]] Actor *target() const noexcept
    {
        return target_.get();
    }

    [[nodiscard]] const ActorRef &targetRef() const noexcept
    {
        return target_;
    }

    /// @brief Actor whose turn created the message; null for external sends.
    /// @note Identity only; use lockSender() before calling into the actor.
    [[nodiscard]] Actor *sender() const noexcept
    {
        return sender_;
    }

    /// @brief Owning handle to the sender, or null once it is gone.
    [[nodiscard]] ActorRef lockSender() const noexcept
    {
        return senderRef_.lock();
    }

    [[nodiscard]] const Value &receiver() const noexcept
    {
        return receiver_;
    }

    [[nodiscard]] support::Symbol selector() const noexcept
    {
        return selector_;
    }

    [[nodiscard]] const std::vector<Value> &arguments() const noexcept
    {
        return arguments_;
    }

    [[nodiscard]] const ResolverRef &resolver() const noexcept
    {
        return resolver_;
    }

    [[nodiscard]] const support::SourceLocation &callSite() const noexcept
    {
        return callSite_;
    }

    /// @brief Whether delivery must be treated as a breakpoint hit.
    [[nodiscard]] bool isPaused() const noexcept
    {
        return paused_;
    }

    void markPaused() noexcept
    {
        paused_ = true;
    }

    /// @brief Whether the message is ready to be delivered to its target.
    [[nodiscard]] bool isBound() const noexcept
    {
        return kind_ == MessageKind::Direct || bound_;
    }

    /// @brief Bind a dependent message to the resolution of its promise.
    /// @param value Final value of the promise.
    /// @param outcome Outcome of the promise.
    /// @param promiseOwner Actor the promise lives in; may be null.
    /// @throws ProtocolError{Unroutable} when no target actor can be derived.
    void bindResolution(const Value &value, Outcome outcome, const ActorRef &promiseOwner);

    /// @brief Whether the interpreter runs this message.
    /// @details Dependent messages whose resolution does not match what they
    ///          react to skip the method body and forward the resolution.
    [[nodiscard]] bool shouldInvoke() const noexcept;

    /// @brief Value forwarded to the resolver when shouldInvoke() is false.
    [[nodiscard]] const Value &forwardedValue() const noexcept
    {
        return boundValue_;
    }

    /// @brief Outcome forwarded to the resolver when shouldInvoke() is false.
    [[nodiscard]] Outcome forwardedOutcome() const noexcept
    {
        return boundOutcome_;
    }

    /// @brief Set once a receiver breakpoint hit was reported for this message.
    /// @details Guarded by the target actor's lock.
    [[nodiscard]] bool breakpointReported() const noexcept
    {
        return breakpointReported_;
    }

    void markBreakpointReported() noexcept
    {
        breakpointReported_ = true;
    }

  private:
    EventualMessage(MessageKind kind,
                    ActorRef target,
                    Actor *sender,
                    Value receiver,
                    support::Symbol selector,
                    std::vector<Value> arguments,
                    ResolverRef resolver,
                    support::SourceLocation callSite);

    const uint64_t id_;
    const MessageKind kind_;
    ActorRef target_;
    Actor *const sender_;
    const std::weak_ptr<Actor> senderRef_;
    Value receiver_;
    const support::Symbol selector_;
    std::vector<Value> arguments_;
    const ResolverRef resolver_;
    const support::SourceLocation callSite_;
    std::optional<CallbackKind> callbackKind_;

    bool bound_ = false;
    Value boundValue_;
    Outcome boundOutcome_ = Outcome::Success;
    bool paused_ = false;
    bool breakpointReported_ = false;
};

} // namespace strand::actors
