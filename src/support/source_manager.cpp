//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.cpp
// Purpose: Backing store for source origin identifiers used by call sites and
//          breakpoints.
// Key invariants: Identifiers start at one; zero marks an unknown origin.
// Ownership/Lifetime: The manager owns the URI strings it hands out views of.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <iostream>
#include <limits>
#include <sstream>

namespace strand::support
{

/// @brief Register a URI and assign it a stable identifier.
///
/// @details Registering the same URI twice returns the identifier assigned the
///          first time.  When the identifier space is exhausted an error
///          diagnostic is printed and 0 is returned.
///
/// @param uri Origin URI (file path, module URI, ...).
/// @return Identifier (>0) representing the stored URI.
uint32_t SourceManager::addOrigin(std::string uri)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (auto it = uri_to_id_.find(uri); it != uri_to_id_.end())
        return it->second;

    if (next_origin_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string(kSourceManagerOriginIdOverflowMessage));
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t origin_id = static_cast<uint32_t>(next_origin_id_++);
    origins_.push_back(std::move(uri));
    uri_to_id_.emplace(std::string_view{origins_.back()}, origin_id);
    return origin_id;
}

std::optional<uint32_t> SourceManager::findOrigin(std::string_view uri) const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (auto it = uri_to_id_.find(uri); it != uri_to_id_.end())
        return it->second;
    return std::nullopt;
}

/// @brief Retrieve the URI associated with an origin identifier.
///
/// @param origin_id 1-based identifier previously returned by addOrigin().
/// @return Stored URI, or an empty view if @p origin_id is invalid.
std::string_view SourceManager::getUri(uint32_t origin_id) const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (origin_id == 0 || origin_id > origins_.size())
        return {};
    return origins_[origin_id - 1];
}

SourceLocation SourceManager::locationOf(uint32_t origin_id,
                                         uint32_t line,
                                         uint32_t column,
                                         uint32_t char_offset) const
{
    if (getUri(origin_id).empty())
        return {};
    return SourceLocation{origin_id, line, column, char_offset};
}

std::string SourceManager::format(const SourceLocation &loc) const
{
    std::ostringstream os;
    std::string_view uri = getUri(loc.origin_id);
    if (uri.empty())
        os << "<unknown>";
    else
        os << uri;
    os << ':' << loc.line << ':' << loc.column << '@' << loc.char_offset;
    return os.str();
}
} // namespace strand::support
