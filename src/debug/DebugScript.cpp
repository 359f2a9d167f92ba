//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the script loader used by the actor debugger.  Scripts are text
// files with one command per line ("pause worker", "break receiver * a.st:3:5:40")
// which are applied to a debug session to automate interactive sessions.
//
//===----------------------------------------------------------------------===//

#include "debug/DebugScript.hpp"

#include "debug/DebugActor.hpp"
#include "debug/DebugSession.hpp"
#include "support/source_manager.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>

namespace strand::debug
{
namespace
{

std::string_view trim(std::string_view s)
{
    const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

bool parseU32(std::string_view text, uint32_t &out)
{
    if (text.empty())
        return false;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc() && ptr == end;
}

/// Split "<uri>:<line>:<col>:<offset>" from the right so the URI may itself
/// contain colons ("file:///a.st").
bool parseLocation(std::string_view text, DebugCommand &cmd)
{
    uint32_t fields[3] = {0, 0, 0};
    for (int i = 2; i >= 0; --i)
    {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos || !parseU32(text.substr(colon + 1), fields[i]))
            return false;
        text = text.substr(0, colon);
    }
    if (text.empty())
        return false;
    cmd.uri = std::string(text);
    cmd.line = fields[0];
    cmd.column = fields[1];
    cmd.offset = fields[2];
    return true;
}

std::optional<DebugCommandKind> actorCommand(std::string_view word)
{
    if (word == "pause")
        return DebugCommandKind::Pause;
    if (word == "resume")
        return DebugCommandKind::Resume;
    if (word == "step-into")
        return DebugCommandKind::StepInto;
    if (word == "step-over")
        return DebugCommandKind::StepOver;
    if (word == "step-return")
        return DebugCommandKind::StepReturn;
    return std::nullopt;
}

} // namespace

/// @brief Construct a script by loading commands from a file.
///
/// An unreadable file is reported as an error diagnostic and leaves the
/// script empty so callers can still run programmatically added commands.
DebugScript::DebugScript(const std::string &path, support::DiagnosticEngine &de)
{
    std::ifstream f(path);
    if (!f)
    {
        de.report({support::Severity::Error, "unable to open debug script " + path, {}});
        return;
    }
    load(f, de);
}

/// @brief Parse a single command line.
///
/// Accepted forms:
///   attach [actor]
///   pause|resume|step-into|step-over|step-return <actor>
///   break|clear <receiver|sender> <actor|*> <uri>:<line>:<col>:<offset>
support::Expected<DebugCommand> DebugScript::parseLine(std::string_view line, support::SourceLocation where)
{
    std::istringstream iss{std::string(trim(line))};
    std::vector<std::string> words;
    for (std::string w; iss >> w;)
        words.push_back(std::move(w));
    if (words.empty())
        return support::makeError(where, "empty debug command");

    DebugCommand cmd;
    const std::string &verb = words[0];
    if (verb == "attach")
    {
        if (words.size() > 2)
            return support::makeError(where, "usage: attach [actor]");
        cmd.kind = DebugCommandKind::Attach;
        if (words.size() == 2)
            cmd.actor = words[1];
        return cmd;
    }

    if (auto kind = actorCommand(verb))
    {
        if (words.size() != 2)
            return support::makeError(where, "usage: " + verb + " <actor>");
        cmd.kind = *kind;
        cmd.actor = words[1];
        return cmd;
    }

    if (verb == "break" || verb == "clear")
    {
        if (words.size() != 4)
            return support::makeError(where, "usage: " + verb + " <receiver|sender> <actor|*> <uri>:<line>:<col>:<offset>");
        cmd.kind = verb == "break" ? DebugCommandKind::Break : DebugCommandKind::Clear;
        if (words[1] == "receiver")
            cmd.side = BreakpointSide::Receiver;
        else if (words[1] == "sender")
            cmd.side = BreakpointSide::Sender;
        else
            return support::makeError(where, "unknown breakpoint side '" + words[1] + "'");
        if (words[2] != "*")
            cmd.actor = words[2];
        if (!parseLocation(words[3], cmd))
            return support::makeError(where, "malformed location '" + words[3] + "'");
        return cmd;
    }

    return support::makeError(where, "unknown debug command '" + verb + "'");
}

/// @brief Queue every well-formed line of @p in.
///
/// Blank lines and lines starting with '#' are skipped.  Malformed lines are
/// reported to @p de, located at their line in @p originId when one is given,
/// and ignored so partially written scripts remain usable.
size_t DebugScript::load(std::istream &in, support::DiagnosticEngine &de, uint32_t originId)
{
    size_t queued = 0;
    uint32_t lineNo = 0;
    std::string line;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::string_view text = trim(line);
        if (text.empty() || text.front() == '#')
            continue;
        support::SourceLocation where{};
        if (originId != 0)
            where = {originId, lineNo, 1, 0};
        auto parsed = parseLine(text, where);
        if (!parsed)
        {
            de.report(parsed.error());
            continue;
        }
        commands_.push_back(std::move(parsed.value()));
        ++queued;
    }
    return queued;
}

void DebugScript::add(DebugCommand cmd)
{
    commands_.push_back(std::move(cmd));
}

std::optional<DebugCommand> DebugScript::next()
{
    if (commands_.empty())
        return std::nullopt;
    DebugCommand cmd = std::move(commands_.front());
    commands_.pop_front();
    return cmd;
}

/// @brief Execute @p cmd against @p session.
///
/// Actor names are looked up in the session directory when the command runs.
/// Breakpoint locations register their URI with the session's source manager
/// so scripts may name files the runtime has not seen yet.
support::Expected<void> DebugScript::apply(const DebugCommand &cmd, DebugSession &session)
{
    std::shared_ptr<DebugActor> actor;
    if (!cmd.actor.empty())
    {
        actor = session.findActor(cmd.actor);
        if (!actor)
            return support::makeError({}, "no debug actor named '" + cmd.actor + "'");
    }

    switch (cmd.kind)
    {
        case DebugCommandKind::Attach:
            if (actor)
                actor->attach();
            else
                session.attachAll();
            return {};
        case DebugCommandKind::Pause:
            actor->pause();
            return {};
        case DebugCommandKind::Resume:
            if (!actor->resume())
                return support::makeWarning({}, "actor '" + cmd.actor + "' is not paused");
            return {};
        case DebugCommandKind::StepInto:
            actor->stepInto();
            return {};
        case DebugCommandKind::StepOver:
            actor->stepOver();
            return {};
        case DebugCommandKind::StepReturn:
            actor->stepReturn();
            return {};
        case DebugCommandKind::Break:
        case DebugCommandKind::Clear:
            break;
    }

    support::SourceManager *sm = session.sources();
    if (!sm)
        return support::makeError({}, "breakpoints need a source manager");
    const uint32_t origin = sm->addOrigin(cmd.uri);
    if (origin == 0)
        return support::makeError({}, "cannot register source '" + cmd.uri + "'");
    const support::SourceLocation loc = sm->locationOf(origin, cmd.line, cmd.column, cmd.offset);

    if (cmd.kind == DebugCommandKind::Break)
    {
        if (actor)
            actor->addBreakpoint(loc, cmd.side);
        else
            session.addBreakpoint(loc, cmd.side);
        return {};
    }

    const bool removed = actor ? actor->removeBreakpoint(loc, cmd.side) : session.removeBreakpoint(loc, cmd.side);
    if (!removed)
        return support::makeWarning(loc, "no breakpoint at " + sm->format(loc));
    return {};
}

size_t DebugScript::runAll(DebugSession &session, support::DiagnosticEngine &de)
{
    size_t applied = 0;
    while (auto cmd = next())
    {
        auto result = apply(*cmd, session);
        if (!result)
        {
            de.report(result.error());
            continue;
        }
        ++applied;
    }
    return applied;
}

} // namespace strand::debug
