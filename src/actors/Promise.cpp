//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Promise.cpp
// Purpose: Implements promise resolution, dependent fan-out and chaining.
// Key invariants:
//   - The state transition and the hand-off of the dependent and chain lists
//     happen in one critical section; dependents are delivered after the lock
//     is released so actor locks are never taken under a promise lock.
//   - Chaining never holds two promise locks at once.
// Ownership/Lifetime: Dependents are moved out of the promise when it commits;
//                     the target actors own them from then on.
// Links: src/actors/Promise.hpp, src/actors/Actor.cpp
//
//===----------------------------------------------------------------------===//

#include "actors/Promise.hpp"

#include "actors/Actor.hpp"
#include "actors/Errors.hpp"
#include "actors/EventualMessage.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace strand::actors
{
namespace
{
std::atomic<uint64_t> nextPromiseId{1};

bool isFinal(Resolution r) noexcept
{
    return r == Resolution::Successful || r == Resolution::Erroneous;
}

/// Bind @p msg to a resolution and hand it to its target actor.
void deliver(const MessageRef &msg,
             const Value &value,
             Outcome outcome,
             bool haltOnResolution,
             const ActorRef &promiseOwner)
{
    msg->bindResolution(value, outcome, promiseOwner);
    if (haltOnResolution)
        msg->markPaused();
    msg->targetRef()->send(msg);
}

} // namespace

struct PromiseAccess
{
    /// @brief Reserve @p p for one resolve.
    /// @throws AlreadyResolvedError when @p p left Unresolved or is claimed.
    static void claim(Promise &p)
    {
        std::lock_guard<std::mutex> lock(p.mu_);
        if (p.resolution_ != Resolution::Unresolved || p.claimed_)
            throw AlreadyResolvedError(p.id_);
        p.claimed_ = true;
    }

    static void release(Promise &p) noexcept
    {
        std::lock_guard<std::mutex> lock(p.mu_);
        p.claimed_ = false;
    }

    /// @brief First promise reached from @p from that is not chained.
    static PromiseRef rootOf(PromiseRef from)
    {
        while (from)
        {
            PromiseRef next;
            {
                std::lock_guard<std::mutex> lock(from->mu_);
                if (from->resolution_ != Resolution::Chained)
                    return from;
                next = from->chainRoot_.lock();
            }
            if (!next)
                return from;
            from = std::move(next);
        }
        return from;
    }

    /// @brief Move @p root from @p expected to its final state and fan out.
    ///
    /// Promises chained onto @p root are committed from a worklist, so a long
    /// chain costs no stack.
    /// @throws AlreadyResolvedError when @p root is not in @p expected.
    /// @throws ProtocolError first failure met while scheduling dependents,
    ///         rethrown once every dependent and chained promise was handled.
    static void commit(Promise &root, Value value, Outcome outcome, bool haltOnResolution, Resolution expected)
    {
        struct Step
        {
            Promise *promise;
            std::shared_ptr<Promise> keepAlive;
            bool halt;
        };

        std::vector<Step> work;
        work.push_back({&root, nullptr, haltOnResolution});
        std::exception_ptr firstFailure;

        while (!work.empty())
        {
            Step step = std::move(work.back());
            work.pop_back();
            Promise &p = *step.promise;
            const Resolution from = &p == &root ? expected : Resolution::Chained;

            std::vector<MessageRef> dependents;
            std::vector<Promise::ChainLink> chained;
            try
            {
                std::lock_guard<std::mutex> lock(p.mu_);
                if (p.resolution_ != from)
                    throw AlreadyResolvedError(p.id_);
                p.resolution_ = outcome == Outcome::Success ? Resolution::Successful : Resolution::Erroneous;
                p.value_ = value;
                p.committedHaltOnResolution_ = step.halt;
                p.chainRoot_.reset();
                dependents.swap(p.dependents_);
                chained.swap(p.chained_);
            }
            catch (const ProtocolError &)
            {
                if (&p == &root)
                    throw;
                if (!firstFailure)
                    firstFailure = std::current_exception();
                continue;
            }

            const ActorRef owner = p.lockOwner();
            for (const auto &msg : dependents)
            {
                try
                {
                    deliver(msg, value, outcome, step.halt, owner);
                }
                catch (const ProtocolError &)
                {
                    if (!firstFailure)
                        firstFailure = std::current_exception();
                }
            }

            // Reverse so chained promises commit in registration order.
            for (auto it = chained.rbegin(); it != chained.rend(); ++it)
            {
                Promise *next = it->promise.get();
                work.push_back({next, std::move(it->promise), it->haltOnResolution || next->haltOnResolution()});
            }
        }

        if (firstFailure)
            std::rethrow_exception(firstFailure);
    }

    /// @brief Make @p outer wait on @p inner, committing at once if @p inner is final.
    static void chain(Promise &outer, const PromiseRef &inner, const PromiseRef &root, bool haltOnResolution)
    {
        {
            std::lock_guard<std::mutex> lock(outer.mu_);
            if (outer.resolution_ != Resolution::Unresolved)
                throw AlreadyResolvedError(outer.id_);
            outer.resolution_ = Resolution::Chained;
            outer.chainRoot_ = root;
        }

        Value innerValue;
        Outcome innerOutcome = Outcome::Success;
        {
            std::lock_guard<std::mutex> lock(inner->mu_);
            if (!isFinal(inner->resolution_))
            {
                inner->chained_.push_back({outer.shared_from_this(), haltOnResolution});
                return;
            }
            innerValue = inner->value_;
            innerOutcome = inner->resolution_ == Resolution::Successful ? Outcome::Success : Outcome::Error;
        }
        commit(outer, std::move(innerValue), innerOutcome, haltOnResolution, Resolution::Chained);
    }

    static void addDependent(Promise &p, MessageRef msg)
    {
        Value value;
        Outcome outcome = Outcome::Success;
        bool halt = false;
        {
            std::lock_guard<std::mutex> lock(p.mu_);
            if (!isFinal(p.resolution_))
            {
                p.dependents_.push_back(std::move(msg));
                return;
            }
            value = p.value_;
            outcome = p.resolution_ == Resolution::Successful ? Outcome::Success : Outcome::Error;
            halt = p.committedHaltOnResolution_ || p.haltOnResolution();
        }
        deliver(msg, value, outcome, halt, p.lockOwner());
    }

    /// @brief Detach chained promises that only @p p keeps alive.
    static void unlink(Promise &p) noexcept
    {
        std::vector<Promise::ChainLink> pending;
        pending.swap(p.chained_);
        while (!pending.empty())
        {
            std::shared_ptr<Promise> next = std::move(pending.back().promise);
            pending.pop_back();
            if (next.use_count() == 1)
            {
                auto &more = next->chained_;
                std::move(more.begin(), more.end(), std::back_inserter(pending));
                more.clear();
            }
        }
    }

    static uint64_t nextId() noexcept
    {
        return nextPromiseId.fetch_add(1, std::memory_order_relaxed);
    }
};

Promise::Promise(Actor *owner)
    : id_(PromiseAccess::nextId()), owner_(owner),
      ownerRef_(owner ? owner->weak_from_this() : std::weak_ptr<Actor>{})
{
}

Promise::~Promise()
{
    PromiseAccess::unlink(*this);
}

Resolution Promise::resolution() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return resolution_;
}

bool Promise::isResolved() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return isFinal(resolution_);
}

Value Promise::value() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return isFinal(resolution_) ? value_ : Value{Nil{}};
}

std::optional<Outcome> Promise::outcome() const
{
    std::lock_guard<std::mutex> lock(mu_);
    switch (resolution_)
    {
        case Resolution::Successful:
            return Outcome::Success;
        case Resolution::Erroneous:
            return Outcome::Error;
        default:
            return std::nullopt;
    }
}

size_t Promise::pendingDependents() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return dependents_.size();
}

Resolver::Resolver(std::shared_ptr<Promise> promise) : promise_(std::move(promise))
{
    if (!promise_)
        throw std::invalid_argument("Resolver: null promise");
}

PromisePair createPair(Actor *owner)
{
    auto promise = std::make_shared<Promise>(owner);
    auto resolver = std::make_shared<Resolver>(promise);
    return {std::move(promise), std::move(resolver)};
}

void resolve(const Resolver &resolver,
             Value value,
             Outcome outcome,
             bool haltOnResolverOverride,
             bool haltOnResolutionOverride,
             HaltListener *listener)
{
    Promise &p = *resolver.promise();
    PromiseAccess::claim(p);

    PromiseRef inner = asPromise(value);
    PromiseRef root;
    try
    {
        if (inner.get() == &p)
            throw ProtocolError(ProtocolErrorKind::SelfChain,
                                "promise #" + std::to_string(p.id()) + " cannot be resolved with itself");
        if (inner)
        {
            root = PromiseAccess::rootOf(inner);
            if (root.get() == &p)
                throw ProtocolError(ProtocolErrorKind::SelfChain,
                                    "resolving promise #" + std::to_string(p.id()) + " with promise #" +
                                        std::to_string(inner->id()) + " would form a chaining cycle");
        }

        const bool haltOnResolver = haltOnResolverOverride || p.haltOnResolver();
        if (haltOnResolver && !inner && listener)
            listener->onResolverHalt(p, value);
    }
    catch (...)
    {
        PromiseAccess::release(p);
        throw;
    }

    const bool haltOnResolution = haltOnResolutionOverride || p.haltOnResolution();
    if (inner)
        PromiseAccess::chain(p, inner, root, haltOnResolution);
    else
        PromiseAccess::commit(p, std::move(value), outcome, haltOnResolution, Resolution::Unresolved);
}

void addDependent(Promise &promise, MessageRef message)
{
    if (!message)
        throw std::invalid_argument("addDependent: null message");
    PromiseAccess::addDependent(promise, std::move(message));
}

} // namespace strand::actors
