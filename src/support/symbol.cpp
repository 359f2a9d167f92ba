//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/symbol.cpp
// Purpose: Hashing for selector handles used as keys of method tables.
// Key invariants: Equal symbols hash equally.
// Ownership/Lifetime: Stateless.
// Links: src/support/symbol.hpp
//
//===----------------------------------------------------------------------===//

#include "support/symbol.hpp"

namespace strand::support
{

/// @brief Hash a selector handle.
///
/// Interners hand out ids densely from 1, so the raw id would fill buckets
/// in order.  A multiplicative mix (Knuth's 2^32 / phi) spreads neighbouring
/// selectors apart.
size_t SymbolHash::operator()(Symbol s) const noexcept
{
    return static_cast<size_t>(s.id) * static_cast<size_t>(0x9E3779B1u);
}

} // namespace strand::support
