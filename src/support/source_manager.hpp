//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping source origin identifiers to URIs.
// Key invariants: Origin ID 0 is invalid; a URI keeps its id once assigned.
// Ownership/Lifetime: Manager owns the URI strings.
// Links: src/support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace strand::support
{

inline constexpr std::string_view kSourceManagerOriginIdOverflowMessage =
    "source manager exhausted origin identifier space";

/// Maintains the mapping between numeric origin identifiers and the URIs of the
/// sources they name.  Breakpoints and call sites carry only the identifier;
/// the manager turns it back into text for trace lines and diagnostics.
class SourceManager
{
  public:
    /// @brief Register origin @p uri and return its id.
    /// @return Origin identifier (>0 on success, 0 on overflow).
    uint32_t addOrigin(std::string uri);

    /// @brief Find the identifier previously assigned to @p uri.
    std::optional<uint32_t> findOrigin(std::string_view uri) const;

    /// @brief Retrieve the URI for @p origin_id; empty when unknown.
    std::string_view getUri(uint32_t origin_id) const;

    /// @brief Build a location on a registered origin.
    SourceLocation locationOf(uint32_t origin_id,
                              uint32_t line,
                              uint32_t column,
                              uint32_t char_offset) const;

    /// @brief Render @p loc as "<uri>:<line>:<column>@<offset>".
    /// @details Unknown origins render as "<unknown>".
    std::string format(const SourceLocation &loc) const;

  private:
    mutable std::mutex mu_;

    /// Stored URIs; index + 1 is the origin identifier. std::deque keeps the
    /// strings at stable addresses as new origins are added.
    std::deque<std::string> origins_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_origin_id_ = 1;

    std::unordered_map<std::string_view, uint32_t> uri_to_id_;
};
} // namespace strand::support
