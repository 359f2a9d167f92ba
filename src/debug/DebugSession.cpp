//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugSession.cpp
// Purpose: Implement the actor directory, session-wide breakpoints, the event
//          log and resolver-halt handling.
// Key invariants: See DebugSession.hpp.
// Ownership/Lifetime: Expired directory entries are pruned lazily.
// Links: src/debug/DebugSession.hpp, src/debug/DebugActor.cpp
//
//===----------------------------------------------------------------------===//

#include "debug/DebugSession.hpp"

#include "actors/Actor.hpp"
#include "actors/Trace.hpp"
#include "debug/DebugActor.hpp"

#include <algorithm>
#include <iterator>

namespace strand::debug
{

std::string_view toString(DebugEventKind kind) noexcept
{
    switch (kind)
    {
        case DebugEventKind::ActorAttached:
            return "attached";
        case DebugEventKind::MessageBuffered:
            return "buffered";
        case DebugEventKind::MessageAddedToMailbox:
            return "mailbox-add";
        case DebugEventKind::MessageReleased:
            return "released";
        case DebugEventKind::BreakpointHit:
            return "breakpoint-hit";
        case DebugEventKind::FutureBreakpointInstalled:
            return "future-breakpoint";
        case DebugEventKind::ActorPaused:
            return "paused";
        case DebugEventKind::ActorResumed:
            return "resumed";
        case DebugEventKind::ResolverHalt:
            return "resolver-halt";
    }
    return "unknown";
}

DebugSession::DebugSession(support::SourceManager *sm, actors::TraceSink *trace, size_t eventCapacity)
    : sm_(sm), trace_(trace), eventCapacity_(eventCapacity)
{
}

void DebugSession::registerActor(const std::shared_ptr<DebugActor> &actor)
{
    if (!actor)
        return;
    std::vector<SideKey> install;
    {
        std::lock_guard<std::mutex> lock(mu_);
        actors_[actor->id()] = actor;
        install.assign(sessionBreakpoints_.begin(), sessionBreakpoints_.end());
    }
    for (const auto &key : install)
        actor->addBreakpoint(key.loc, key.side);
}

void DebugSession::unregisterActor(uint64_t actorId)
{
    std::lock_guard<std::mutex> lock(mu_);
    actors_.erase(actorId);
}

std::shared_ptr<DebugActor> DebugSession::findActor(uint64_t actorId) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = actors_.find(actorId);
    return it == actors_.end() ? nullptr : it->second.lock();
}

std::shared_ptr<DebugActor> DebugSession::findActor(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &[id, weak] : actors_)
    {
        if (auto actor = weak.lock(); actor && actor->name() == name)
            return actor;
    }
    return nullptr;
}

std::shared_ptr<DebugActor> DebugSession::lookup(const actors::Actor *actor) const
{
    if (!actor)
        return nullptr;
    auto found = findActor(actor->id());
    return found.get() == actor ? found : nullptr;
}

std::vector<std::shared_ptr<DebugActor>> DebugSession::actors() const
{
    std::vector<std::shared_ptr<DebugActor>> out;
    std::lock_guard<std::mutex> lock(mu_);
    out.reserve(actors_.size());
    for (const auto &[id, weak] : actors_)
    {
        if (auto actor = weak.lock())
            out.push_back(std::move(actor));
    }
    return out;
}

size_t DebugSession::attachAll()
{
    size_t moved = 0;
    for (const auto &actor : actors())
    {
        if (actor->debuggingState() != DebuggingState::Initial)
            continue;
        actor->attach();
        ++moved;
    }
    return moved;
}

BreakpointRef DebugSession::addBreakpoint(const support::SourceLocation &loc, BreakpointSide side)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        sessionBreakpoints_.insert(SideKey{loc, side});
    }
    BreakpointRef bp = registry_.getOrCreate(loc, side);
    for (const auto &actor : actors())
        actor->addBreakpoint(loc, side);
    return bp;
}

bool DebugSession::removeBreakpoint(const support::SourceLocation &loc, BreakpointSide side)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        sessionBreakpoints_.erase(SideKey{loc, side});
    }
    bool removed = false;
    for (const auto &actor : actors())
        removed = actor->removeBreakpoint(loc, side) || removed;
    return registry_.remove(loc, side) || removed;
}

void DebugSession::record(DebugEvent event)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (eventCapacity_ == 0)
    {
        ++droppedEvents_;
        return;
    }
    if (events_.size() == eventCapacity_)
    {
        events_.pop_front();
        ++droppedEvents_;
    }
    events_.push_back(event);
}

uint64_t DebugSession::droppedEvents() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return droppedEvents_;
}

std::vector<DebugEvent> DebugSession::events() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return {events_.begin(), events_.end()};
}

std::vector<DebugEvent> DebugSession::eventsFor(uint64_t actorId) const
{
    std::vector<DebugEvent> out;
    std::lock_guard<std::mutex> lock(mu_);
    std::copy_if(events_.begin(),
                 events_.end(),
                 std::back_inserter(out),
                 [actorId](const DebugEvent &e) { return e.actorId == actorId; });
    return out;
}

size_t DebugSession::countEvents(DebugEventKind kind, uint64_t actorId) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<size_t>(std::count_if(events_.begin(),
                                             events_.end(),
                                             [&](const DebugEvent &e)
                                             { return e.kind == kind && (actorId == 0 || e.actorId == actorId); }));
}

void DebugSession::clearEvents()
{
    std::lock_guard<std::mutex> lock(mu_);
    events_.clear();
    droppedEvents_ = 0;
}

/// @brief Stop the actor whose turn resolved a promise flagged haltOnResolver.
///
/// @details The halt is always logged and traced.  Only a DebugActor of this
///          session can be paused; resolutions made outside any actor, or by
///          plain actors, are recorded but do not stop anything.
void DebugSession::onResolverHalt(const actors::Promise &promise, const actors::Value &)
{
    actors::Actor *current = actors::Actor::current();
    record({DebugEventKind::ResolverHalt, current ? current->id() : 0, 0, {}, promise.id()});
    if (trace_)
        trace_->onBreak(current, 0, {}, "resolver");
    if (auto actor = lookup(current))
        actor->haltAtBreakpoint();
}

} // namespace strand::debug
