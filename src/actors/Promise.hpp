//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Promise.hpp
// Purpose: Declares the one-shot Promise/Resolver pair and its resolution
//          protocol, including fan-out to dependent messages and chaining.
// Key invariants:
//   - A promise leaves Unresolved exactly once; a second resolve throws
//     AlreadyResolvedError and the stored value never changes.
//   - The resolution cell, the dependent list and the chain list are guarded
//     by one mutex, so addDependent racing resolve delivers exactly once.
//   - haltOnResolver / haltOnResolution are sticky: once set, never cleared.
//   - A resolve claims the promise under its mutex before notifying any
//     listener, so only one resolver ever reports a halt.
//   - Chaining never forms a cycle; resolving would do so throws SelfChain.
// Ownership/Lifetime: Promise and Resolver share the promise through
//                     std::shared_ptr; the owner actor is held weakly.
// Links: src/actors/Promise.cpp, src/actors/EventualMessage.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Value.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace strand::actors
{

class EventualMessage;
using MessageRef = std::shared_ptr<EventualMessage>;

/// @brief Outcome a resolver reports.
enum class Outcome : uint8_t
{
    Success,
    Error,
};

/// @brief Resolution state of a promise.
/// @details Chained is the explicit, non-terminal state of a promise that was
///          resolved with another promise and waits for it.
enum class Resolution : uint8_t
{
    Unresolved,
    Chained,
    Successful,
    Erroneous,
};

constexpr std::string_view toString(Resolution r) noexcept
{
    switch (r)
    {
        case Resolution::Unresolved:
            return "unresolved";
        case Resolution::Chained:
            return "chained";
        case Resolution::Successful:
            return "successful";
        case Resolution::Erroneous:
            return "erroneous";
    }
    return "unknown";
}

/// @brief Receives resolver halts raised by resolutions with haltOnResolver.
class HaltListener
{
  public:
    virtual ~HaltListener() = default;

    /// @brief Called on the resolving thread before @p value is committed.
    virtual void onResolverHalt(const Promise &promise, const Value &value) = 0;
};

/// @brief Consumer side of a one-shot future value.
class Promise : public std::enable_shared_from_this<Promise>
{
  public:
    /// @brief Create an unresolved promise living in @p owner (may be null).
    /// @note Use createPair(); a promise without its resolver cannot resolve.
    explicit Promise(Actor *owner);

    /// @brief Releases promises still chained onto this one without recursing.
    ~Promise();

    Promise(const Promise &) = delete;
    Promise &operator=(const Promise &) = delete;

    [[nodiscard]] uint64_t id() const noexcept
    {
        return id_;
    }

    /// @brief Actor the promise lives in; executes pipelined sends on local values.
    [[nodiscard]] Actor *owner() const noexcept
    {
        return owner_;
    }

    /// @brief Owning handle to the owner, or null once it is gone.
    [[nodiscard]] ActorRef lockOwner() const noexcept
    {
        return ownerRef_.lock();
    }

    [[nodiscard]] Resolution resolution() const;

    /// @brief True once the promise holds a final value (successful or erroneous).
    [[nodiscard]] bool isResolved() const;

    /// @brief Final value; Nil while unresolved or chained.
    [[nodiscard]] Value value() const;

    /// @brief Outcome of the final value, if any.
    [[nodiscard]] std::optional<Outcome> outcome() const;

    /// @brief Number of dependent messages still waiting on this promise.
    [[nodiscard]] size_t pendingDependents() const;

    void enableHaltOnResolver() noexcept
    {
        haltOnResolver_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool haltOnResolver() const noexcept
    {
        return haltOnResolver_.load(std::memory_order_acquire);
    }

    void enableHaltOnResolution() noexcept
    {
        haltOnResolution_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool haltOnResolution() const noexcept
    {
        return haltOnResolution_.load(std::memory_order_acquire);
    }

  private:
    /// Resolution internals are reached only through Promise.cpp.
    friend struct PromiseAccess;

    struct ChainLink
    {
        std::shared_ptr<Promise> promise; ///< Promise waiting on this one.
        bool haltOnResolution = false;    ///< Effective flag captured at chaining.
    };

    mutable std::mutex mu_;
    Resolution resolution_ = Resolution::Unresolved;
    bool claimed_ = false; ///< A resolve is in progress or done.
    Value value_;
    bool committedHaltOnResolution_ = false; ///< Tag applied to late dependents.
    std::vector<MessageRef> dependents_;
    std::vector<ChainLink> chained_;
    std::weak_ptr<Promise> chainRoot_; ///< Last unchained promise seen when chaining.

    std::atomic<bool> haltOnResolver_{false};
    std::atomic<bool> haltOnResolution_{false};

    const uint64_t id_;
    Actor *owner_;
    std::weak_ptr<Actor> ownerRef_;
};

/// @brief Producer side of a promise; the only handle allowed to resolve it.
class Resolver
{
  public:
    explicit Resolver(std::shared_ptr<Promise> promise);

    [[nodiscard]] const std::shared_ptr<Promise> &promise() const noexcept
    {
        return promise_;
    }

  private:
    std::shared_ptr<Promise> promise_;
};

using ResolverRef = std::shared_ptr<Resolver>;

/// @brief Linked promise and resolver sharing one resolution cell.
struct PromisePair
{
    PromiseRef promise;
    ResolverRef resolver;
};

/// @brief Create a linked pair in the Unresolved state.
/// @param owner Actor the promise lives in; null for promises created outside
///              any actor.
PromisePair createPair(Actor *owner = nullptr);

/// @brief Resolve the promise behind @p resolver.
///
/// Throws AlreadyResolvedError when the promise already left Unresolved or
/// another resolve claimed it, and ProtocolError{SelfChain} when @p value is
/// the promise itself or a promise chained (directly or not) onto it.  When
/// haltOnResolver applies (flag or override) and @p value is not a promise,
/// @p listener is notified before the value is committed.  Resolving with a
/// promise chains: the promise becomes Chained and later commits with the
/// inner promise's value.
/// Every dependent is scheduled onto its target actor; an ActorTornDownError
/// from a dependent is rethrown after the remaining dependents were scheduled.
void resolve(const Resolver &resolver,
             Value value,
             Outcome outcome,
             bool haltOnResolverOverride = false,
             bool haltOnResolutionOverride = false,
             HaltListener *listener = nullptr);

/// @brief Register @p message to run once @p promise resolves.
/// @details If the promise is already resolved the message is bound to the
///          stored value and scheduled immediately.
void addDependent(Promise &promise, MessageRef message);

} // namespace strand::actors
