//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/Expected.hpp
// Purpose: Value-or-error container for expected failures.
// Key invariants: Exactly one of value or error is engaged; the error is never the
//                 "no error" value.
// Ownership/Lifetime: Expected owns its value; the error shares its model.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/Error.hpp"

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace scopeline::support
{

/// @brief Expected-style container pairing a value with an Error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @note Propagation is manual: callers check hasValue() and re-return error().
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                       std::is_constructible_v<T, U &&>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct a failed result holding @p error.
    /// @throws std::invalid_argument when @p error is the "no error" value.
    Expected(Error error) : error_(std::move(error))
    {
        if (!error_)
            throw std::invalid_argument("Expected constructed from an empty Error");
    }

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

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

    /// @brief Access the error; the "no error" value on success.
    const Error &error() const &
    {
        return error_;
    }

  private:
    std::optional<T> value_;
    Error error_;
};

/// @brief Expected specialisation for operations with no success payload.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result.
    Expected() = default;

    /// @brief Construct a result holding @p error; an empty error means success.
    Expected(Error error) : error_(std::move(error)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const Error &error() const &
    {
        return error_;
    }

  private:
    Error error_;
};

} // namespace scopeline::support
