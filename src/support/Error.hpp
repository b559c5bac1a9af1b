//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/Error.hpp
// Purpose: Error value protocol for expected, recoverable failures.
// Key invariants: Any type with a const description() convertible to std::string
//                 qualifies as an error value. Error compares by identity: copies of
//                 one Error are equal, independently created errors are not.
// Ownership/Lifetime: Error shares an immutable, heap-allocated model between copies.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace scopeline::support
{

class Error;

namespace detail
{
template <typename T, typename = void> struct HasDescription : std::false_type
{
};

template <typename T>
struct HasDescription<T, std::void_t<decltype(std::string(std::declval<const T &>().description()))>>
    : std::true_type
{
};

template <typename T, typename = void> struct HasUnwrap : std::false_type
{
};

template <typename T>
struct HasUnwrap<T, std::void_t<decltype(std::declval<const T &>().unwrap())>>
    : std::is_convertible<decltype(std::declval<const T &>().unwrap()), Error>
{
};
} // namespace detail

/// @brief True when @p T satisfies the error value protocol.
template <typename T> inline constexpr bool isErrorValue = detail::HasDescription<T>::value;

/// @brief Type-erased error value with safe downcast and identity comparison.
/// @details A default-constructed Error represents "no error".  Discrimination by
///          concrete kind is done through is<T>() / as<T>() rather than by parsing
///          descriptions.  Errors carry no control-flow effect of their own.
class Error
{
  public:
    /// @brief Construct the "no error" value.
    Error() = default;

    /// @brief Wrap any value implementing description().
    template <typename T,
              typename D = std::decay_t<T>,
              typename = std::enable_if_t<!std::is_same_v<D, Error> && isErrorValue<D>>>
    Error(T &&value) : model_(std::make_shared<const Holder<D>>(std::forward<T>(value)))
    {
    }

    /// @brief Create an error whose description is @p text.
    static Error message(std::string text);

    /// @brief Create an error that annotates @p cause with @p context.
    /// @details The description reads "context: cause".  unwrap() yields @p cause.
    static Error wrap(Error cause, std::string context);

    /// @brief True when an error is present.
    explicit operator bool() const noexcept
    {
        return static_cast<bool>(model_);
    }

    /// @brief True when no error is present.
    [[nodiscard]] bool isNone() const noexcept
    {
        return !model_;
    }

    /// @brief Human-readable description; empty for the "no error" value.
    std::string description() const;

    /// @brief Dynamic type of the wrapped value, typeid(void) when empty.
    std::type_index kind() const noexcept;

    /// @brief Check whether the wrapped value is exactly of type @p T.
    template <typename T> bool is() const noexcept
    {
        return as<T>() != nullptr;
    }

    /// @brief Downcast to @p T.
    /// @return Pointer to the wrapped value, or nullptr on kind mismatch.
    template <typename T> const T *as() const noexcept
    {
        if (!model_ || model_->type() != std::type_index(typeid(T)))
            return nullptr;
        return static_cast<const T *>(model_->address());
    }

    /// @brief Cause wrapped by this error, or the "no error" value.
    Error unwrap() const;

    /// @brief Identity comparison.
    friend bool operator==(const Error &lhs, const Error &rhs) noexcept
    {
        return lhs.model_ == rhs.model_;
    }

    friend bool operator!=(const Error &lhs, const Error &rhs) noexcept
    {
        return !(lhs == rhs);
    }

  private:
    struct Model
    {
        virtual ~Model() = default;
        virtual std::string description() const = 0;
        virtual std::type_index type() const noexcept = 0;
        virtual const void *address() const noexcept = 0;
        virtual Error unwrap() const = 0;
    };

    template <typename T> struct Holder final : Model
    {
        template <typename U> explicit Holder(U &&v) : value(std::forward<U>(v)) {}

        std::string description() const override
        {
            return std::string(value.description());
        }

        std::type_index type() const noexcept override
        {
            return std::type_index(typeid(T));
        }

        const void *address() const noexcept override
        {
            return &value;
        }

        Error unwrap() const override
        {
            if constexpr (detail::HasUnwrap<T>::value)
                return value.unwrap();
            else
                return Error();
        }

        T value;
    };

    std::shared_ptr<const Model> model_;
};

/// @brief Plain message error created by Error::message.
struct MessageError
{
    std::string text;

    const std::string &description() const
    {
        return text;
    }
};

/// @brief Error annotating a cause with extra context.
struct WrappedError
{
    std::string context;
    Error cause;

    std::string description() const;

    Error unwrap() const
    {
        return cause;
    }
};

/// @brief Walk the unwrap chain of @p err looking for @p target by identity.
bool errorIs(const Error &err, const Error &target);

/// @brief Walk the unwrap chain of @p err looking for a value of kind @p T.
/// @return First matching value, or nullptr when none is found.
template <typename T> const T *errorAs(const Error &err)
{
    for (Error cur = err; cur; cur = cur.unwrap())
    {
        if (const T *hit = cur.as<T>())
        {
            // The chain keeps every link alive through the original error.
            return hit;
        }
    }
    return nullptr;
}

} // namespace scopeline::support
