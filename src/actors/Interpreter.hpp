//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Interpreter.hpp
// Purpose: Declares the collaborator that executes method bodies for a turn.
// Key invariants: invoke() runs on the worker thread that owns the turn and
//                 never observes two turns of the same actor concurrently.
// Ownership/Lifetime: The runtime borrows the interpreter; it must outlive
//                     every actor that uses it.
// Links: src/actors/Actor.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Value.hpp"
#include "support/symbol.hpp"

#include <vector>

namespace strand::actors
{

class Actor;

/// @brief Executes a method body on behalf of the actor core.
class Interpreter
{
  public:
    virtual ~Interpreter() = default;

    /// @brief Run @p selector on @p receiver with @p arguments.
    /// @param current Actor whose turn is executing.
    /// @return Result value of the method body.
    /// @throws RuntimeSignal when the method body fails; the payload becomes
    ///         the Error outcome of the message's promise.
    virtual Value invoke(const Value &receiver,
                         support::Symbol selector,
                         const std::vector<Value> &arguments,
                         Actor &current) = 0;
};

} // namespace strand::actors
