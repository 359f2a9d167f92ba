//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Value.hpp
// Purpose: Declares the dynamic value model exchanged between actor turns.
// Key invariants: Heap objects are opaque to the core; only promises and far
//                 references carry scheduling meaning.
// Ownership/Lifetime: Values share ownership of heap objects, promises and
//                     actors through std::shared_ptr.
// Links: src/actors/Promise.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace strand::actors
{

class Actor;
class Promise;

/// @brief Base of interpreter-owned heap objects (method receivers, blocks).
/// @details The scheduling core never looks inside an object; it only moves
///          references between turns and hands them back to the interpreter.
class Object
{
  public:
    virtual ~Object() = default;
};

using ObjectRef = std::shared_ptr<Object>;
using ActorRef = std::shared_ptr<Actor>;
using PromiseRef = std::shared_ptr<Promise>;

/// @brief The absent value.
struct Nil
{
};

/// @brief Reference to an object that lives inside another actor.
/// @details Messages addressed through a far reference execute on @ref owner.
struct FarReference
{
    ActorRef owner;   ///< Actor that owns @ref object.
    ObjectRef object; ///< Receiver inside the owning actor.
};

/// @brief Dynamically typed value.
using Value = std::variant<Nil, bool, int64_t, double, std::string, ObjectRef, FarReference, PromiseRef>;

bool operator==(Nil, Nil) noexcept;
bool operator==(const FarReference &a, const FarReference &b) noexcept;

/// @brief Promise held by @p v, or null.
[[nodiscard]] PromiseRef asPromise(const Value &v);

/// @brief Whether @p v is a reference to an object in another actor.
[[nodiscard]] bool isFarReference(const Value &v) noexcept;

/// @brief Short printable rendering used by [TURN] trace lines.
std::string describe(const Value &v);

} // namespace strand::actors
