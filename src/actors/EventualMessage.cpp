//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/EventualMessage.cpp
// Purpose: Implements message construction and the one-time binding of
//          dependent messages to a promise resolution.
// Key invariants: Message identifiers are unique for the process lifetime.
// Ownership/Lifetime: See EventualMessage.hpp.
// Links: src/actors/EventualMessage.hpp, src/actors/Promise.cpp
//
//===----------------------------------------------------------------------===//

#include "actors/EventualMessage.hpp"

#include "actors/Actor.hpp"
#include "actors/Errors.hpp"

#include <atomic>
#include <stdexcept>
#include <utility>

namespace strand::actors
{
namespace
{
std::atomic<uint64_t> nextMessageId{1};
} // namespace

EventualMessage::EventualMessage(MessageKind kind,
                                 ActorRef target,
                                 Actor *sender,
                                 Value receiver,
                                 support::Symbol selector,
                                 std::vector<Value> arguments,
                                 ResolverRef resolver,
                                 support::SourceLocation callSite)
    : id_(nextMessageId.fetch_add(1, std::memory_order_relaxed)), kind_(kind),
      target_(std::move(target)), sender_(sender),
      senderRef_(sender ? sender->weak_from_this() : std::weak_ptr<Actor>{}), receiver_(std::move(receiver)),
      selector_(selector), arguments_(std::move(arguments)), resolver_(std::move(resolver)),
      callSite_(callSite)
{
}

MessageRef EventualMessage::direct(ActorRef target,
                                   Actor *sender,
                                   Value receiver,
                                   support::Symbol selector,
                                   std::vector<Value> arguments,
                                   ResolverRef resolver,
                                   support::SourceLocation callSite)
{
    if (!target)
        throw std::invalid_argument("EventualMessage::direct: null target actor");
    return MessageRef(new EventualMessage(MessageKind::Direct,
                                          std::move(target),
                                          sender,
                                          std::move(receiver),
                                          selector,
                                          std::move(arguments),
                                          std::move(resolver),
                                          callSite));
}

MessageRef EventualMessage::promiseSend(Actor *sender,
                                        support::Symbol selector,
                                        std::vector<Value> arguments,
                                        ResolverRef resolver,
                                        support::SourceLocation callSite)
{
    return MessageRef(new EventualMessage(MessageKind::PromiseSend,
                                          nullptr,
                                          sender,
                                          Nil{},
                                          selector,
                                          std::move(arguments),
                                          std::move(resolver),
                                          callSite));
}

MessageRef EventualMessage::callback(ActorRef registrar,
                                     Value block,
                                     support::Symbol selector,
                                     CallbackKind kind,
                                     ResolverRef resolver,
                                     support::SourceLocation callSite)
{
    if (!registrar)
        throw std::invalid_argument("EventualMessage::callback: null registering actor");
    Actor *sender = registrar.get();
    MessageRef msg(new EventualMessage(MessageKind::PromiseCallback,
                                       std::move(registrar),
                                       sender,
                                       std::move(block),
                                       selector,
                                       {},
                                       std::move(resolver),
                                       callSite));
    msg->callbackKind_ = kind;
    return msg;
}

/// @brief Route a dependent message once its promise has a final value.
///
/// @details A pipelined send takes the resolved value as its receiver.  When
///          the value is a far reference the send travels to the owning actor
///          and the referenced object becomes the receiver; any other value is
///          local to the promise's owner, so the send executes there (or in
///          the sender when the promise has no owner).  A callback keeps its
///          registering actor as target and receives the value as its single
///          argument.
void EventualMessage::bindResolution(const Value &value, Outcome outcome, const ActorRef &promiseOwner)
{
    if (kind_ == MessageKind::Direct)
        return;
    if (bound_)
        throw std::logic_error("EventualMessage: message #" + std::to_string(id_) +
                               " is already bound to a resolution");

    if (kind_ == MessageKind::PromiseSend)
    {
        if (isFarReference(value))
        {
            const auto &far = std::get<FarReference>(value);
            target_ = far.owner;
            receiver_ = far.object;
        }
        else
        {
            ActorRef home = promiseOwner ? promiseOwner : senderRef_.lock();
            if (!home)
                throw ProtocolError(ProtocolErrorKind::Unroutable,
                                    "pipelined message #" + std::to_string(id_) +
                                        " resolved to a local value without an owning actor");
            target_ = std::move(home);
            receiver_ = value;
        }
    }
    else
    {
        arguments_.assign(1, value);
    }

    boundValue_ = value;
    boundOutcome_ = outcome;
    bound_ = true;
}

bool EventualMessage::shouldInvoke() const noexcept
{
    switch (kind_)
    {
        case MessageKind::Direct:
            return true;
        case MessageKind::PromiseSend:
            return boundOutcome_ == Outcome::Success;
        case MessageKind::PromiseCallback:
            if (callbackKind_ == CallbackKind::OnError)
                return boundOutcome_ == Outcome::Error;
            return boundOutcome_ == Outcome::Success;
    }
    return true;
}

} // namespace strand::actors
