//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/symbol.hpp
// Purpose: Handle naming an interned message selector.
// Key invariants: Id 0 is the null selector; ids are only meaningful for the
//                 interner that issued them.
// Ownership/Lifetime: Trivially copyable value; the text lives in the interner.
// Links: src/support/string_interner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace strand::support
{

/// @brief Interned selector handle carried by every eventual message.
struct Symbol
{
    /// @brief One-based index into the issuing interner; 0 when unset.
    uint32_t id = 0;

    [[nodiscard]] constexpr bool isValid() const noexcept
    {
        return id != 0;
    }

    constexpr explicit operator bool() const noexcept
    {
        return isValid();
    }
};

constexpr bool operator==(Symbol a, Symbol b) noexcept
{
    return a.id == b.id;
}

constexpr bool operator!=(Symbol a, Symbol b) noexcept
{
    return !(a == b);
}

/// @brief Hash functor spreading sequential selector ids across buckets.
struct SymbolHash
{
    size_t operator()(Symbol s) const noexcept;
};

} // namespace strand::support

namespace std
{
template <> struct hash<strand::support::Symbol> : strand::support::SymbolHash
{
};
} // namespace std
