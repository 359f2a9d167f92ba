//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Breakpoint.hpp
// Purpose: Declare breakpoint descriptors and the session-wide registry.
// Key invariants: At most one descriptor exists per (location, side); the
//                 enabled flag is the only mutable field.
// Ownership/Lifetime: The registry owns descriptors through shared_ptr so
//                     actors may hold on to removed ones safely.
// Links: src/debug/DebugSession.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strand::debug
{

/// @brief Which end of a send a breakpoint watches.
enum class BreakpointSide : uint8_t
{
    Sender,   ///< Send expression in the sending actor.
    Receiver, ///< Delivery of the message to its target actor.
};

constexpr std::string_view toString(BreakpointSide side) noexcept
{
    return side == BreakpointSide::Sender ? "sender" : "receiver";
}

/// @brief Breakpoint on a message call site.
struct Breakpoint
{
    Breakpoint(uint32_t id, support::SourceLocation location, BreakpointSide side)
        : id(id), location(location), side(side)
    {
    }

    const uint32_t id;                       ///< Registry-assigned identifier.
    const support::SourceLocation location;  ///< Call site the breakpoint matches.
    const BreakpointSide side;               ///< Sender or receiver end.
    std::atomic<bool> enabled{true};         ///< Disabled breakpoints never match.
};

using BreakpointRef = std::shared_ptr<Breakpoint>;

/// @brief Registry of breakpoint descriptors keyed by location and side.
class BreakpointRegistry
{
  public:
    /// @brief Return the descriptor for (@p loc, @p side), creating it enabled.
    BreakpointRef getOrCreate(const support::SourceLocation &loc, BreakpointSide side);

    /// @brief Descriptor for (@p loc, @p side), or null.
    BreakpointRef find(const support::SourceLocation &loc, BreakpointSide side) const;

    /// @brief Drop the descriptor; returns false when none existed.
    bool remove(const support::SourceLocation &loc, BreakpointSide side);

    /// @brief Toggle the descriptor; returns false when none exists.
    bool setEnabled(const support::SourceLocation &loc, BreakpointSide side, bool enabled);

    /// @brief Whether @p bp is registered and enabled.
    bool isEnabled(const Breakpoint &bp) const;

    /// @brief Snapshot of all descriptors ordered by id.
    std::vector<BreakpointRef> list() const;

    size_t size() const;

  private:
    using Map = std::unordered_map<support::SourceLocation, BreakpointRef, support::SourceLocationHash>;

    Map &mapFor(BreakpointSide side)
    {
        return side == BreakpointSide::Sender ? sender_ : receiver_;
    }

    const Map &mapFor(BreakpointSide side) const
    {
        return side == BreakpointSide::Sender ? sender_ : receiver_;
    }

    mutable std::mutex mu_;
    Map sender_;
    Map receiver_;
    uint32_t nextId_ = 1;
};

} // namespace strand::debug
