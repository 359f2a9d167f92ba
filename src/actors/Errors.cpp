//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Errors.cpp
// Purpose: Implements the constructors of the actor core exception types.
// Key invariants: Messages name the offending promise or actor identifier.
// Ownership/Lifetime: Not applicable.
// Links: src/actors/Errors.hpp
//
//===----------------------------------------------------------------------===//

#include "actors/Errors.hpp"

namespace strand::actors
{

ProtocolError::ProtocolError(ProtocolErrorKind kind, const std::string &what)
    : std::logic_error(std::string(toString(kind)) + ": " + what), kind_(kind)
{
}

AlreadyResolvedError::AlreadyResolvedError(uint64_t promiseId)
    : ProtocolError(ProtocolErrorKind::AlreadyResolved,
                    "promise #" + std::to_string(promiseId) + " is already resolved"),
      promiseId_(promiseId)
{
}

ActorTornDownError::ActorTornDownError(uint64_t actorId)
    : ProtocolError(ProtocolErrorKind::ActorTornDown,
                    "actor " + std::to_string(actorId) + " no longer accepts messages"),
      actorId_(actorId)
{
}

RuntimeSignal::RuntimeSignal(Value payload, const std::string &what)
    : std::runtime_error(what), payload_(std::move(payload))
{
}

RuntimeSignal::RuntimeSignal(const std::string &what) : std::runtime_error(what), payload_(what) {}

} // namespace strand::actors
