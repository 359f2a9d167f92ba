//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugScript.hpp
// Purpose: Parse debugger command scripts and apply them to a session.
// Key invariants: Malformed lines are reported and skipped; commands run in
//                 FIFO order.
// Ownership/Lifetime: Holds parsed commands only; actors are resolved by name
//                     when a command runs.
// Links: src/debug/DebugScript.cpp, src/debug/DebugSession.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debug/Breakpoint.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstdint>
#include <deque>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace strand::debug
{

class DebugSession;

/// @brief Supported debugger commands.
enum class DebugCommandKind
{
    Attach,     ///< Attach one actor, or every actor when none is named
    Pause,      ///< Pause an actor
    Resume,     ///< Resume an actor and drain its inbox
    StepInto,   ///< Release one message, stop after its turn
    StepOver,   ///< Release one message, run on when the inbox is empty
    StepReturn, ///< Release one message, stop at its resolution
    Break,      ///< Install a breakpoint
    Clear       ///< Remove a breakpoint
};

/// @brief Parsed command from a debug script.
struct DebugCommand
{
    DebugCommandKind kind = DebugCommandKind::Attach;
    std::string actor;                           ///< Target actor; empty means all
    BreakpointSide side = BreakpointSide::Receiver; ///< Break/Clear only
    std::string uri;                             ///< Break/Clear only
    uint32_t line = 0;                           ///< Break/Clear only
    uint32_t column = 0;                         ///< Break/Clear only
    uint32_t offset = 0;                         ///< Break/Clear only
};

/// @brief FIFO script of debugger commands.
class DebugScript
{
  public:
    /// @brief Create an empty script.
    DebugScript() = default;

    /// @brief Load commands from script file @p path.
    /// @details An unreadable file is reported to @p de and leaves the script empty.
    DebugScript(const std::string &path, support::DiagnosticEngine &de);

    /// @brief Parse one script line.
    /// @param where Location reported with a parse error.
    static support::Expected<DebugCommand> parseLine(std::string_view line, support::SourceLocation where = {});

    /// @brief Parse every line of @p in; returns the number of commands queued.
    size_t load(std::istream &in, support::DiagnosticEngine &de, uint32_t originId = 0);

    /// @brief Append @p cmd to the script.
    void add(DebugCommand cmd);

    /// @brief Retrieve the next command, if any.
    std::optional<DebugCommand> next();

    bool empty() const
    {
        return commands_.empty();
    }

    size_t size() const
    {
        return commands_.size();
    }

    /// @brief Apply one command to @p session.
    static support::Expected<void> apply(const DebugCommand &cmd, DebugSession &session);

    /// @brief Apply and consume every queued command; failures go to @p de.
    /// @return Number of commands applied successfully.
    size_t runAll(DebugSession &session, support::DiagnosticEngine &de);

  private:
    std::deque<DebugCommand> commands_; ///< Pending commands
};

} // namespace strand::debug
