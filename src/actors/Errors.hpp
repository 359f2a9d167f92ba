//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Errors.hpp
// Purpose: Defines the error taxonomy of the actor core.
// Key invariants: ProtocolError signals a programming error and is never
//                 retried; RuntimeSignal is a recoverable turn failure whose
//                 payload becomes the Error outcome of the message's promise.
// Ownership/Lifetime: Exception objects own their payloads.
// Links: src/actors/Promise.cpp, src/actors/Actor.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Value.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strand::actors
{

/// @brief Categorises protocol violations.
enum class ProtocolErrorKind : int32_t
{
    AlreadyResolved = 0, ///< Resolver used after its promise left Unresolved.
    ActorTornDown = 1,   ///< Message scheduled onto an actor whose mailbox is gone.
    SelfChain = 2,       ///< Promise resolved with itself.
    Unroutable = 3,      ///< Dependent message whose resolved value names no actor.
};

/// @brief Convert a protocol error kind to its canonical name.
constexpr std::string_view toString(ProtocolErrorKind kind) noexcept
{
    switch (kind)
    {
        case ProtocolErrorKind::AlreadyResolved:
            return "AlreadyResolved";
        case ProtocolErrorKind::ActorTornDown:
            return "ActorTornDown";
        case ProtocolErrorKind::SelfChain:
            return "SelfChain";
        case ProtocolErrorKind::Unroutable:
            return "Unroutable";
    }
    return "Unknown";
}

/// @brief Hard failure raised when a caller breaks the actor/promise protocol.
class ProtocolError : public std::logic_error
{
  public:
    ProtocolError(ProtocolErrorKind kind, const std::string &what);

    [[nodiscard]] ProtocolErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    ProtocolErrorKind kind_;
};

/// @brief A promise was resolved a second time.
class AlreadyResolvedError final : public ProtocolError
{
  public:
    explicit AlreadyResolvedError(uint64_t promiseId);

    [[nodiscard]] uint64_t promiseId() const noexcept
    {
        return promiseId_;
    }

  private:
    uint64_t promiseId_;
};

/// @brief A message was sent to an actor after tearDown().
class ActorTornDownError final : public ProtocolError
{
  public:
    explicit ActorTornDownError(uint64_t actorId);

    [[nodiscard]] uint64_t actorId() const noexcept
    {
        return actorId_;
    }

  private:
    uint64_t actorId_;
};

/// @brief Failure raised by the interpreter while executing a method body.
/// @details The payload is the error value the message's promise is resolved
///          with; the actor carries on with its next message.
class RuntimeSignal : public std::runtime_error
{
  public:
    RuntimeSignal(Value payload, const std::string &what);

    /// @brief Signal whose payload is the message text.
    explicit RuntimeSignal(const std::string &what);

    [[nodiscard]] const Value &payload() const noexcept
    {
        return payload_;
    }

  private:
    Value payload_;
};

} // namespace strand::actors
