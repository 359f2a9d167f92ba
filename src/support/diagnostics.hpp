//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Collects problems found while reading debugger scripts and other
//          front-end input.
// Key invariants: Per-severity counts always match the stored diagnostics.
// Ownership/Lifetime: The engine owns every diagnostic reported to it.
// Links: src/support/diag_expected.hpp, src/debug/DebugScript.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace strand::support
{

class SourceManager;

/// @brief How serious a reported problem is.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief One reported problem.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLocation loc;  ///< Where the problem was found; may be unknown
};

/// @brief Ordered sink for diagnostics.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every diagnostic in report order.
    /// @param sm Resolves origin ids to URIs; locations print as ids without it.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of diagnostics reported with @p severity.
    size_t count(Severity severity) const;

    size_t errorCount() const
    {
        return count(Severity::Error);
    }

    size_t warningCount() const
    {
        return count(Severity::Warning);
    }

    bool hasErrors() const
    {
        return errorCount() != 0;
    }

    /// @brief Forget every diagnostic and reset the counts.
    void clear();

  private:
    std::vector<Diagnostic> diags_;
    std::array<size_t, 3> counts_{};
};

} // namespace strand::support
