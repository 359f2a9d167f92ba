//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/actors/Value.cpp
// Purpose: Implements classification and rendering helpers for Value.
// Key invariants: describe() never throws on well-formed values.
// Ownership/Lifetime: Stateless helpers.
// Links: src/actors/Value.hpp
//
//===----------------------------------------------------------------------===//

#include "actors/Value.hpp"

#include "actors/Actor.hpp"
#include "actors/Promise.hpp"

#include <sstream>

namespace strand::actors
{

bool operator==(Nil, Nil) noexcept
{
    return true;
}

bool operator==(const FarReference &a, const FarReference &b) noexcept
{
    return a.owner == b.owner && a.object == b.object;
}

PromiseRef asPromise(const Value &v)
{
    if (const auto *p = std::get_if<PromiseRef>(&v))
        return *p;
    return nullptr;
}

bool isFarReference(const Value &v) noexcept
{
    const auto *far = std::get_if<FarReference>(&v);
    return far && far->owner;
}

/// @brief Render a value for diagnostics.
///
/// @details Strings are quoted, objects print their address, far references
///          name the owning actor, and promises print their identifier and
///          current resolution state.
std::string describe(const Value &v)
{
    std::ostringstream os;
    std::visit(
        [&os](const auto &x)
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, Nil>)
                os << "nil";
            else if constexpr (std::is_same_v<T, bool>)
                os << (x ? "true" : "false");
            else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>)
                os << x;
            else if constexpr (std::is_same_v<T, std::string>)
                os << '"' << x << '"';
            else if constexpr (std::is_same_v<T, ObjectRef>)
                os << "object@" << static_cast<const void *>(x.get());
            else if constexpr (std::is_same_v<T, FarReference>)
            {
                os << "far(";
                if (x.owner)
                    os << "actor=" << x.owner->id();
                else
                    os << "actor=?";
                os << ", object@" << static_cast<const void *>(x.object.get()) << ')';
            }
            else if constexpr (std::is_same_v<T, PromiseRef>)
            {
                if (x)
                    os << "promise#" << x->id() << '[' << toString(x->resolution()) << ']';
                else
                    os << "promise#null";
            }
        },
        v);
    return os.str();
}

} // namespace strand::actors
