//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Diagnostic collection and bulk printing.
// Key invariants: counts_ is indexed by Severity.
// Ownership/Lifetime: See diagnostics.hpp.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"

#include <utility>

namespace strand::support
{

void DiagnosticEngine::report(Diagnostic d)
{
    ++counts_[static_cast<size_t>(d.severity)];
    diags_.push_back(std::move(d));
}

/// @brief Write each stored diagnostic with printDiag().
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

size_t DiagnosticEngine::count(Severity severity) const
{
    return counts_[static_cast<size_t>(severity)];
}

void DiagnosticEngine::clear()
{
    diags_.clear();
    counts_.fill(0);
}

} // namespace strand::support
