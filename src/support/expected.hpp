//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/expected.hpp
// Purpose: Provides a lightweight Expected container pairing a value with a
//          typed error payload.
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Expected owns its value or error by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace cortado::support
{

/// @brief Expected-style container pairing a value with an error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload type describing a failure.
/// @note Mirrors a subset of std::expected until the standard type becomes
///       universally available on our toolchain.
template <class T, class E> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to E to
    ///          avoid colliding with the error constructor below.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       std::is_constructible_v<T, U &&>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for operations without a success payload.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

} // namespace cortado::support
