//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Trace.hpp
// Purpose: Declare tracing configuration and sink for actor turns and
//          debugger events.
// Key invariants: Trace output is line-oriented; lines from concurrent
//                 workers never interleave.
// Ownership/Lifetime: The sink holds its configuration by value; the stream,
//                     source manager and interner are borrowed.
// Links: src/actors/Trace.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "actors/Promise.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace strand::support
{
class SourceManager;
class StringInterner;
} // namespace strand::support

namespace strand::actors
{

class Actor;
class EventualMessage;

/// @brief Configuration for runtime tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Turns, ///< One line per completed turn
        Debug  ///< Turns plus debugger state changes
    } mode{Off};

    /// @brief Destination stream; null means std::cerr.
    std::ostream *out = nullptr;

    /// @brief Optional source manager for rendering call sites.
    const support::SourceManager *sm = nullptr;

    /// @brief Optional interner for rendering selectors by name.
    const support::StringInterner *selectors = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;

    /// @brief Check whether debugger events are traced.
    bool debugEnabled() const;

    /// @brief Parse "off", "turns" or "debug" (case-insensitive).
    static std::optional<Mode> parseMode(std::string_view text);
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    [[nodiscard]] const TraceConfig &config() const noexcept
    {
        return cfg;
    }

    /// @brief Record completion of the turn that processed @p msg.
    /// @param result Value the turn resolves its promise with.
    void onTurn(const Actor &actor, const EventualMessage &msg, Outcome outcome, const Value &result);

    /// @brief Record a breakpoint hit at @p loc.
    /// @param actor Actor that stops; null when no actor is executing.
    /// @param msgId Message involved, 0 for none.
    void onBreak(const Actor *actor, uint64_t msgId, const support::SourceLocation &loc, std::string_view reason);

    /// @brief Record a debugger state change of @p actor.
    void onDebug(const Actor &actor, std::string_view event, uint64_t msgId = 0);

  private:
    std::ostream &stream() const;
    void writeActor(std::ostream &os, const Actor *actor) const;
    void writeLocation(std::ostream &os, const support::SourceLocation &loc) const;

    TraceConfig cfg; ///< Active configuration
    std::mutex mu_;  ///< Serialises whole lines
};

} // namespace strand::actors
