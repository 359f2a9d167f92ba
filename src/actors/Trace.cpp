//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Trace.cpp
// Purpose: Implement the trace sink that renders turn and debugger events.
// Key invariants: Each event produces exactly one newline-terminated line
//                 written under the sink mutex.
// Ownership/Lifetime: See Trace.hpp.
// Links: src/actors/Trace.hpp
//
//===----------------------------------------------------------------------===//

#include "actors/Trace.hpp"

#include "actors/Actor.hpp"
#include "actors/EventualMessage.hpp"
#include "support/source_manager.hpp"
#include "support/string_interner.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

namespace strand::actors
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

bool TraceConfig::debugEnabled() const
{
    return mode == Debug;
}

std::optional<TraceConfig::Mode> TraceConfig::parseMode(std::string_view text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char c : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "off" || lower == "0")
        return Off;
    if (lower == "turns" || lower == "1")
        return Turns;
    if (lower == "debug")
        return Debug;
    return std::nullopt;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::writeActor(std::ostream &os, const Actor *actor) const
{
    if (!actor)
    {
        os << "actor=-";
        return;
    }
    os << "actor=" << actor->id() << ':' << actor->name();
}

void TraceSink::writeLocation(std::ostream &os, const support::SourceLocation &loc) const
{
    if (cfg.sm)
    {
        os << cfg.sm->format(loc);
        return;
    }
    os << '#' << loc.origin_id << ':' << loc.line << ':' << loc.column << '@' << loc.char_offset;
}

/// @brief Emit a [TURN] line for a finished turn.
/// @details The selector is printed by name when an interner is configured and
///          by symbol id otherwise.  Lines are assembled off-lock and written
///          in one call so concurrent workers cannot interleave fragments.
void TraceSink::onTurn(const Actor &actor, const EventualMessage &msg, Outcome outcome, const Value &result)
{
    if (!cfg.enabled())
        return;
    std::ostringstream line;
    line << "[TURN] ";
    writeActor(line, &actor);
    line << " msg=" << msg.id() << " sel=";
    if (cfg.selectors && msg.selector())
        line << cfg.selectors->lookup(msg.selector());
    else
        line << '#' << msg.selector().id;
    line << " outcome=" << (outcome == Outcome::Success ? "ok" : "error") << " value=" << describe(result) << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    stream() << line.str() << std::flush;
}

void TraceSink::onBreak(const Actor *actor, uint64_t msgId, const support::SourceLocation &loc, std::string_view reason)
{
    if (!cfg.enabled())
        return;
    std::ostringstream line;
    line << "[BREAK] ";
    writeActor(line, actor);
    if (msgId != 0)
        line << " msg=" << msgId;
    line << " src=";
    writeLocation(line, loc);
    line << " reason=" << reason << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    stream() << line.str() << std::flush;
}

void TraceSink::onDebug(const Actor &actor, std::string_view event, uint64_t msgId)
{
    if (!cfg.debugEnabled())
        return;
    std::ostringstream line;
    line << "[DEBUG] ";
    writeActor(line, &actor);
    line << " event=" << event;
    if (msgId != 0)
        line << " msg=" << msgId;
    line << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    stream() << line.str() << std::flush;
}

} // namespace strand::actors
