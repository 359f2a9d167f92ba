//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.cpp
// Purpose: Implements comparison and hashing for SourceLocation keys.
// Key invariants: Two locations are equal iff all four fields match.
// Ownership/Lifetime: Stateless helpers.
// Links: src/support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace strand::support
{

/// @brief Structural equality over origin, line, column and offset.
bool operator==(const SourceLocation &a, const SourceLocation &b) noexcept
{
    return a.origin_id == b.origin_id && a.line == b.line && a.column == b.column &&
           a.char_offset == b.char_offset;
}

bool operator!=(const SourceLocation &a, const SourceLocation &b) noexcept
{
    return !(a == b);
}

/// @brief Mix the four fields into a single hash value.
///
/// @details Uses the boost-style combine step so locations that differ only in
///          column or offset still land in different buckets.
size_t SourceLocationHash::operator()(const SourceLocation &loc) const noexcept
{
    size_t seed = std::hash<uint32_t>{}(loc.origin_id);
    auto combine = [&seed](uint32_t v)
    { seed ^= std::hash<uint32_t>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2); };
    combine(loc.line);
    combine(loc.column);
    combine(loc.char_offset);
    return seed;
}

} // namespace strand::support
