//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.cpp
// Purpose: Expected<void>, diagnostic factories and the diagnostic printer.
// Key invariants: printDiag always terminates its output with a newline.
// Ownership/Lifetime: Stateless helpers.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace strand::support
{

Expected<void>::Expected(Diag diag) : failed_(true), diag_(std::move(diag)) {}

bool Expected<void>::hasValue() const noexcept
{
    return !failed_;
}

Expected<void>::operator bool() const noexcept
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return diag_;
}

std::string_view toString(Severity severity) noexcept
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

Diag makeError(SourceLocation loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeWarning(SourceLocation loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

/// @brief Render one diagnostic in compiler style.
///
/// Line and column are appended only when known, so a diagnostic located at
/// a whole file prints as "<uri>: error: ...".  Character offsets are not
/// printed; they exist for breakpoint matching, not for people.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view uri = sm && diag.loc.isValid() ? sm->getUri(diag.loc.origin_id) : std::string_view{};
    if (!uri.empty())
    {
        os << uri;
        if (diag.loc.line != 0)
            os << ':' << diag.loc.line;
        if (diag.loc.line != 0 && diag.loc.column != 0)
            os << ':' << diag.loc.column;
        os << ": ";
    }
    os << toString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace strand::support
