//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Breakpoint.cpp
// Purpose: Implement the breakpoint registry.
// Key invariants: Registry operations are linearizable under one mutex.
// Ownership/Lifetime: See Breakpoint.hpp.
// Links: src/debug/Breakpoint.hpp
//
//===----------------------------------------------------------------------===//

#include "debug/Breakpoint.hpp"

#include <algorithm>

namespace strand::debug
{

BreakpointRef BreakpointRegistry::getOrCreate(const support::SourceLocation &loc, BreakpointSide side)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto &map = mapFor(side);
    auto it = map.find(loc);
    if (it != map.end())
        return it->second;
    auto bp = std::make_shared<Breakpoint>(nextId_++, loc, side);
    map.emplace(loc, bp);
    return bp;
}

BreakpointRef BreakpointRegistry::find(const support::SourceLocation &loc, BreakpointSide side) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto &map = mapFor(side);
    auto it = map.find(loc);
    return it == map.end() ? nullptr : it->second;
}

bool BreakpointRegistry::remove(const support::SourceLocation &loc, BreakpointSide side)
{
    std::lock_guard<std::mutex> lock(mu_);
    return mapFor(side).erase(loc) != 0;
}

bool BreakpointRegistry::setEnabled(const support::SourceLocation &loc, BreakpointSide side, bool enabled)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto &map = mapFor(side);
    auto it = map.find(loc);
    if (it == map.end())
        return false;
    it->second->enabled.store(enabled, std::memory_order_release);
    return true;
}

/// @brief Check that @p bp is still the registered descriptor and enabled.
/// @details A descriptor removed from the registry never matches again, even
///          when an actor still holds a reference to it.
bool BreakpointRegistry::isEnabled(const Breakpoint &bp) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto &map = mapFor(bp.side);
    auto it = map.find(bp.location);
    if (it == map.end() || it->second.get() != &bp)
        return false;
    return bp.enabled.load(std::memory_order_acquire);
}

std::vector<BreakpointRef> BreakpointRegistry::list() const
{
    std::vector<BreakpointRef> out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        out.reserve(sender_.size() + receiver_.size());
        for (const auto &[loc, bp] : sender_)
            out.push_back(bp);
        for (const auto &[loc, bp] : receiver_)
            out.push_back(bp);
    }
    std::sort(out.begin(), out.end(), [](const BreakpointRef &a, const BreakpointRef &b) { return a->id < b->id; });
    return out;
}

size_t BreakpointRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return sender_.size() + receiver_.size();
}

} // namespace strand::debug
