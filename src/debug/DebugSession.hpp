//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugSession.hpp
// Purpose: Declare the debugging context shared by every DebugActor of a
//          runtime: breakpoint registry, actor directory and event log.
// Key invariants:
//   - The session mutex is a leaf: nothing is called out of it, so actors may
//     record events while holding their own lock.
//   - Session-wide operations snapshot the directory before calling into
//     actors.
//   - The event log keeps at most eventCapacity() entries; the oldest are
//     dropped first.
// Ownership/Lifetime: Shared by the runtime; actors and the directory refer
//                     to each other weakly, so either side may go first.
// Links: src/debug/DebugActor.hpp, src/debug/Breakpoint.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Promise.hpp"
#include "debug/Breakpoint.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace strand::support
{
class SourceManager;
} // namespace strand::support

namespace strand::actors
{
class Actor;
class TraceSink;
} // namespace strand::actors

namespace strand::debug
{

class DebugActor;

/// @brief Kind of a debugger bookkeeping record.
enum class DebugEventKind : uint8_t
{
    ActorAttached,
    MessageBuffered,
    MessageAddedToMailbox,
    MessageReleased,
    BreakpointHit,
    FutureBreakpointInstalled,
    ActorPaused,
    ActorResumed,
    ResolverHalt,
};

std::string_view toString(DebugEventKind kind) noexcept;

/// @brief One entry of the session event log.
struct DebugEvent
{
    DebugEventKind kind;
    uint64_t actorId = 0;            ///< 0 when no actor was executing.
    uint64_t messageId = 0;          ///< 0 when no message is involved.
    support::SourceLocation location; ///< Call site, when known.
    uint64_t promiseId = 0;           ///< Promise involved in a resolver halt.
};

/// @brief Owned debugging context passed by reference into each DebugActor.
class DebugSession final : public actors::HaltListener
{
  public:
    static constexpr size_t kDefaultEventCapacity = 4096;

    /// @param eventCapacity Maximum number of retained events; 0 keeps none.
    explicit DebugSession(support::SourceManager *sm = nullptr,
                          actors::TraceSink *trace = nullptr,
                          size_t eventCapacity = kDefaultEventCapacity);

    DebugSession(const DebugSession &) = delete;
    DebugSession &operator=(const DebugSession &) = delete;

    BreakpointRegistry &breakpoints() noexcept
    {
        return registry_;
    }

    const BreakpointRegistry &breakpoints() const noexcept
    {
        return registry_;
    }

    support::SourceManager *sources() const noexcept
    {
        return sm_;
    }

    actors::TraceSink *trace() const noexcept
    {
        return trace_;
    }

    /// @brief Add @p actor to the directory and install session-wide breakpoints.
    void registerActor(const std::shared_ptr<DebugActor> &actor);

    void unregisterActor(uint64_t actorId);

    std::shared_ptr<DebugActor> findActor(uint64_t actorId) const;

    /// @brief First registered actor named @p name, or null.
    std::shared_ptr<DebugActor> findActor(std::string_view name) const;

    /// @brief DebugActor view of @p actor if it belongs to this session.
    std::shared_ptr<DebugActor> lookup(const actors::Actor *actor) const;

    /// @brief Live actors ordered by id.
    std::vector<std::shared_ptr<DebugActor>> actors() const;

    /// @brief Attach every actor still in Initial; returns how many moved.
    size_t attachAll();

    /// @brief Install a breakpoint on every current and future actor.
    BreakpointRef addBreakpoint(const support::SourceLocation &loc, BreakpointSide side);

    /// @brief Remove a session-wide breakpoint from every actor and the registry.
    bool removeBreakpoint(const support::SourceLocation &loc, BreakpointSide side);

    /// @brief Append @p event, evicting the oldest entry when the log is full.
    void record(DebugEvent event);

    size_t eventCapacity() const noexcept
    {
        return eventCapacity_;
    }

    /// @brief Events evicted or refused because the log was full.
    uint64_t droppedEvents() const;

    std::vector<DebugEvent> events() const;

    /// @brief Events of one actor, in recording order.
    std::vector<DebugEvent> eventsFor(uint64_t actorId) const;

    size_t countEvents(DebugEventKind kind, uint64_t actorId = 0) const;

    void clearEvents();

    /// @brief Pause the current actor at a resolver halt.
    void onResolverHalt(const actors::Promise &promise, const actors::Value &value) override;

  private:
    struct SideKey
    {
        support::SourceLocation loc;
        BreakpointSide side;

        bool operator==(const SideKey &o) const noexcept
        {
            return loc == o.loc && side == o.side;
        }
    };

    struct SideKeyHash
    {
        size_t operator()(const SideKey &k) const noexcept
        {
            return support::SourceLocationHash{}(k.loc) * 2 + static_cast<size_t>(k.side);
        }
    };

    BreakpointRegistry registry_;
    support::SourceManager *sm_;
    actors::TraceSink *trace_;

    const size_t eventCapacity_;

    mutable std::mutex mu_;
    std::map<uint64_t, std::weak_ptr<DebugActor>> actors_;
    std::unordered_set<SideKey, SideKeyHash> sessionBreakpoints_;
    std::deque<DebugEvent> events_;
    uint64_t droppedEvents_ = 0;
};

} // namespace strand::debug
