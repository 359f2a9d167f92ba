//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Result type for operations that fail with a located diagnostic,
//          plus the one-line diagnostic printer.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: src/support/diagnostics.hpp, src/debug/DebugScript.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace strand::support
{
using Diag = Diagnostic;

/// @brief Either a value of type @p T or the diagnostic explaining its absence.
template <class T> class Expected
{
    static_assert(!std::is_same_v<T, Diag>, "Expected<Diag> is ambiguous");

  public:
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const noexcept
    {
        return state_.index() == 0;
    }

    explicit operator bool() const noexcept
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return std::get<0>(state_);
    }

    /// @pre hasValue()
    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

/// @brief Success-or-diagnostic result of an operation with no payload.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const noexcept;

    explicit operator bool() const noexcept;

    /// @pre !hasValue()
    const Diag &error() const &;

  private:
    bool failed_ = false;
    Diag diag_{Severity::Note, {}, {}};
};

/// @brief Lowercase severity name as printed in front of a message.
std::string_view toString(Severity severity) noexcept;

Diag makeError(SourceLocation loc, std::string msg);

Diag makeWarning(SourceLocation loc, std::string msg);

/// @brief Print "<uri>:<line>:<col>: <severity>: <message>" and a newline.
/// @details The location prefix is dropped when @p sm is null or cannot
///          resolve the origin.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace strand::support
