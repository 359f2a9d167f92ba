//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the call-site location value used as a breakpoint key.
// Key invariants: origin_id == 0 denotes an unknown location; equality is
//                 structural over all four fields.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace strand::support
{

/// @brief Identifies a breakpointable program point.
/// @invariant origin_id == 0 indicates an unknown location.
/// @ownership Value type with no owned resources.
struct SourceLocation
{
    /// @brief Identifier of the source origin assigned by SourceManager.
    uint32_t origin_id = 0;

    /// @brief One-based line where the call site starts; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column where the call site starts; 0 when unknown.
    uint32_t column = 0;

    /// @brief Absolute character offset of the call site within the origin.
    uint32_t char_offset = 0;

    /// @brief Check whether the location references a registered origin.
    [[nodiscard]] bool isValid() const
    {
        return origin_id != 0;
    }
};

bool operator==(const SourceLocation &a, const SourceLocation &b) noexcept;
bool operator!=(const SourceLocation &a, const SourceLocation &b) noexcept;

/// @brief Hash functor combining the four key fields of a SourceLocation.
struct SourceLocationHash
{
    size_t operator()(const SourceLocation &loc) const noexcept;
};

} // namespace strand::support

namespace std
{
template <> struct hash<strand::support::SourceLocation> : strand::support::SourceLocationHash
{
};
} // namespace std
