//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/string_interner.cpp
// Purpose: Selector table implementation.
// Key invariants: ids_ keys view into names_, whose elements never move.
// Ownership/Lifetime: See string_interner.hpp.
// Links: src/support/string_interner.hpp
//
//===----------------------------------------------------------------------===//

#include "string_interner.hpp"

namespace strand::support
{

Symbol StringInterner::intern(std::string_view name)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (auto hit = ids_.find(name); hit != ids_.end())
        return Symbol{hit->second};
    if (names_.size() >= maxSymbols_)
        return Symbol{};

    const std::string &stored = names_.emplace_back(name);
    const auto id = static_cast<uint32_t>(names_.size());
    ids_.emplace(stored, id);
    return Symbol{id};
}

std::string_view StringInterner::lookup(Symbol sym) const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!sym || sym.id > names_.size())
        return {};
    return names_[sym.id - 1];
}

size_t StringInterner::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return names_.size();
}

} // namespace strand::support
