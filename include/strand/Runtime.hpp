//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/strand/Runtime.hpp
// Purpose: Declare the façade that wires the actor core, the debugger and
//          tracing together behind one object.
// Invariants: Every actor spawned by a runtime shares its scheduler,
//             interpreter, trace sink and (when debugging) debug session.
// Ownership: Runtime owns its scheduler, selector interner, source manager
//            and debug session.  Actors are shared with callers and tracked
//            weakly; the runtime tears down the live ones when it stops.  The
//            interpreter is borrowed and must outlive the runtime.
// Links: src/Runtime.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Promise.hpp"
#include "actors/Trace.hpp"
#include "actors/Value.hpp"
#include "support/source_location.hpp"
#include "support/symbol.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strand::actors
{
class Interpreter;
class Scheduler;
} // namespace strand::actors

namespace strand::support
{
class SourceManager;
} // namespace strand::support

namespace strand::debug
{
class DebugActor;
class DebugSession;
} // namespace strand::debug

namespace strand
{

/// @brief Configuration parameters for a runtime.
struct RuntimeConfig
{
    unsigned workers = 0;               ///< Worker threads; 0 uses the hardware count.
    uint32_t turnsPerActivation = 64;   ///< Turns an actor runs before yielding its worker.
    bool debugging = false;             ///< Spawn DebugActors attached to a debug session.
    size_t debugEventCapacity = 4096;   ///< Debug events retained by the session log.
    actors::TraceConfig trace;          ///< Tracing configuration.

    /// @brief Apply STRAND_* environment overrides on top of @p base.
    /// @details Recognised variables: STRAND_WORKERS, STRAND_TURNS_PER_ACTIVATION,
    ///          STRAND_DEBUG (1/true/on, 0/false/off), STRAND_DEBUG_EVENTS and
    ///          STRAND_TRACE (off/turns/debug).  Unparsable values are ignored, preserving
    ///          the value from @p base.
    static RuntimeConfig fromEnvironment(RuntimeConfig base);

    /// @brief Apply STRAND_* environment overrides on top of a default configuration.
    static RuntimeConfig fromEnvironment();
};

inline RuntimeConfig RuntimeConfig::fromEnvironment()
{
    return fromEnvironment(RuntimeConfig{});
}

/// @brief Lightweight façade owning the actor core of one program.
class Runtime
{
  public:
    /// What: Build a runtime running on a fresh worker pool.
    Runtime(actors::Interpreter &interpreter, RuntimeConfig config = {});

    /// What: Build a runtime on a caller-supplied scheduler (tests use a
    ///       deterministic one).
    Runtime(actors::Interpreter &interpreter, RuntimeConfig config, std::unique_ptr<actors::Scheduler> scheduler);

    /// What: Tear down every actor and stop the scheduler.
    /// How:  Pending messages are discarded; running turns finish first.
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    [[nodiscard]] const RuntimeConfig &config() const noexcept;

    /// @brief Intern a selector name.
    support::Symbol selector(std::string_view name);

    /// @brief Name of an interned selector; empty when unknown.
    [[nodiscard]] std::string_view selectorName(support::Symbol sym) const;

    support::SourceManager &sources() noexcept;

    /// @brief Debug session, or null when debugging is off.
    debug::DebugSession *debugSession() noexcept;

    /// @brief Create an actor; a DebugActor when debugging is on.
    actors::ActorRef spawn(std::string name);

    /// @brief Spawned actors that are still alive.
    [[nodiscard]] size_t liveActors() const;

    /// @brief DebugActor view of @p actor, or null.
    [[nodiscard]] std::shared_ptr<debug::DebugActor> debugActor(const actors::ActorRef &actor) const;

    /// @brief Send @p selector to @p receiver inside @p target.
    /// @return Promise for the result; it lives in the calling actor.
    actors::PromiseRef eventualSend(const actors::ActorRef &target,
                                    actors::Value receiver,
                                    support::Symbol selector,
                                    std::vector<actors::Value> args = {},
                                    support::SourceLocation callSite = {});

    /// @brief Send through a far reference; executes in the reference's owner.
    actors::PromiseRef eventualSend(const actors::FarReference &ref,
                                    support::Symbol selector,
                                    std::vector<actors::Value> args = {},
                                    support::SourceLocation callSite = {});

    /// @brief Fire-and-forget send; no promise is created.
    void post(const actors::ActorRef &target,
              actors::Value receiver,
              support::Symbol selector,
              std::vector<actors::Value> args = {},
              support::SourceLocation callSite = {});

    /// @brief Pipeline @p selector on the eventual value of @p promise.
    actors::PromiseRef sendToPromise(const actors::PromiseRef &promise,
                                     support::Symbol selector,
                                     std::vector<actors::Value> args = {},
                                     support::SourceLocation callSite = {});

    /// @brief Run @p block in @p registrar once @p promise resolves successfully.
    /// @return Promise for the block's result; errors pass through.
    actors::PromiseRef whenResolved(const actors::PromiseRef &promise,
                                    const actors::ActorRef &registrar,
                                    actors::Value block,
                                    support::Symbol selector,
                                    support::SourceLocation callSite = {});

    /// @brief Run @p block in @p registrar once @p promise resolves with an error.
    /// @return Promise for the block's result; successful values pass through.
    actors::PromiseRef onError(const actors::PromiseRef &promise,
                               const actors::ActorRef &registrar,
                               actors::Value block,
                               support::Symbol selector,
                               support::SourceLocation callSite = {});

    /// @brief Create a pair living in the calling actor.
    actors::PromisePair createPromisePair();

    /// @brief Resolve through the runtime so resolver halts reach the debugger.
    void resolve(const actors::ResolverRef &resolver,
                 actors::Value value,
                 actors::Outcome outcome = actors::Outcome::Success);

    /// @brief Block until no activation is queued or running.
    /// @throws The first exception that escaped a turn.
    void awaitQuiescence();

    /// @brief Wait for quiescence, then tear down actors and stop the scheduler.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strand
