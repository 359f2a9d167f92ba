//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/string_interner.hpp
// Purpose: Selector table shared by every actor of a runtime.
// Key invariants: Symbol id 0 is never issued; a name keeps its id for the
//                 table's lifetime.
// Ownership/Lifetime: The table owns the names; views returned by lookup()
//                     stay valid until the table is destroyed.
// Links: src/support/symbol.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "symbol.hpp"

#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace strand::support
{

/// @brief Maps selector names to dense Symbol ids and back.
/// @note Turns on different workers intern concurrently; all members lock.
class StringInterner
{
  public:
    /// @param maxSymbols Distinct names accepted before intern() starts
    ///                   returning the null symbol.
    explicit StringInterner(uint32_t maxSymbols = std::numeric_limits<uint32_t>::max()) noexcept
        : maxSymbols_(maxSymbols)
    {
    }

    StringInterner(const StringInterner &) = delete;
    StringInterner &operator=(const StringInterner &) = delete;

    /// @brief Id of @p name, assigning the next one on first sight.
    /// @return The null symbol once the table is full.
    Symbol intern(std::string_view name);

    /// @brief Name behind @p sym; empty for the null or a foreign symbol.
    std::string_view lookup(Symbol sym) const;

    size_t size() const;

  private:
    mutable std::mutex mu_;
    std::deque<std::string> names_; ///< Index i holds the name of id i + 1.
    std::unordered_map<std::string_view, uint32_t> ids_;
    const uint32_t maxSymbols_;
};

} // namespace strand::support
