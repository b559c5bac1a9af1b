//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Fault.hpp
// Purpose: Fault payloads, the active-fault record carried through unwinding, and
//          the report produced when a fault reaches the outermost context.
// Key invariants: A payload always knows how to describe itself. An ActiveFault's
//                 path lists contexts in the order the fault passed through them
//                 (innermost first). Superseded faults are kept newest first.
// Ownership/Lifetime: Payloads own a copy of the raised value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/Error.hpp"

#include <any>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace scopeline::core
{

/// @brief Categorises faults raised by the mechanism itself.
enum class FaultKind : int32_t
{
    User = 0,             ///< Raised explicitly with a RuntimeFault payload.
    ForeignException = 1, ///< A C++ exception escaped a body or deferred action.
    DepthExceeded = 2,    ///< The invocation chain grew past RuntimeConfig::maxDepth.
    InvalidOperation = 3, ///< Operation outside the allowed state machine.
    RuntimeError = 4,     ///< Catch-all for unexpected runtime failures.
};

/// @brief Convert a fault kind to its canonical diagnostic string.
constexpr std::string_view toString(FaultKind kind) noexcept
{
    switch (kind)
    {
        case FaultKind::User:
            return "User";
        case FaultKind::ForeignException:
            return "ForeignException";
        case FaultKind::DepthExceeded:
            return "DepthExceeded";
        case FaultKind::InvalidOperation:
            return "InvalidOperation";
        case FaultKind::RuntimeError:
            return "RuntimeError";
    }
    return "RuntimeError";
}

/// @brief Payload used for faults produced by the mechanism.
struct RuntimeFault
{
    FaultKind kind = FaultKind::RuntimeError;
    std::string message;

    std::string description() const;
};

namespace detail
{
template <typename T> struct PayloadStorage
{
    using type = T;
};

template <> struct PayloadStorage<const char *>
{
    using type = std::string;
};

template <> struct PayloadStorage<char *>
{
    using type = std::string;
};

template <> struct PayloadStorage<std::string_view>
{
    using type = std::string;
};

std::string describeUnknown(const std::type_info &type);

template <typename T> std::string describeValue(const std::any &value)
{
    const T &v = *std::any_cast<T>(&value);
    if constexpr (support::isErrorValue<T>)
        return std::string(v.description());
    else if constexpr (std::is_same_v<T, std::string>)
        return v;
    else if constexpr (std::is_same_v<T, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else
        return describeUnknown(typeid(T));
}
} // namespace detail

/// @brief Type-erased fault payload with safe downcast.
/// @details Any copyable value may be raised.  Character strings are stored as
///          std::string.  Values satisfying the error value protocol describe
///          themselves; strings and numbers are rendered directly; anything else
///          is described by its type.
class FaultPayload
{
  public:
    template <typename T,
              typename D = typename detail::PayloadStorage<std::decay_t<T>>::type,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, FaultPayload>>>
    explicit FaultPayload(T &&value)
        : value_(std::in_place_type<D>, std::forward<T>(value)), describe_(&detail::describeValue<D>)
    {
    }

    /// @brief Human-readable description of the payload.
    std::string description() const
    {
        return describe_(value_);
    }

    /// @brief Dynamic type of the stored value.
    std::type_index type() const noexcept
    {
        return std::type_index(value_.type());
    }

    /// @brief Check whether the payload stores exactly a @p T.
    template <typename T> bool holds() const noexcept
    {
        return get<T>() != nullptr;
    }

    /// @brief Downcast to @p T.
    /// @return Pointer to the stored value, or nullptr on type mismatch.
    template <typename T> const T *get() const noexcept
    {
        return std::any_cast<T>(&value_);
    }

    /// @brief Access the type-erased value.
    const std::any &value() const noexcept
    {
        return value_;
    }

  private:
    std::any value_;
    std::string (*describe_)(const std::any &) = nullptr;
};

/// @brief A fault that was replaced by a newer one raised during its unwind.
struct SupersededFault
{
    FaultPayload payload;
    std::vector<std::string> path; ///< Contexts it had unwound through.
};

/// @brief Fault currently attached to an invocation context.
struct ActiveFault
{
    FaultPayload payload;
    std::string origin;                      ///< Context in which it was raised.
    std::vector<std::string> path;           ///< Contexts unwound so far, innermost first.
    std::vector<SupersededFault> superseded; ///< Replaced faults, newest first.
};

/// @brief Make @p next the active fault, recording @p previous as superseded.
/// @details The previous fault and everything it had superseded are appended to
///          @p next so no fault in the chain is lost.
void supersede(ActiveFault &next, ActiveFault previous);

namespace detail
{
/// @brief Internal unwinding signal.
/// @details Not derived from std::exception, so ordinary
///          `catch (const std::exception &)` handlers in user code let it pass.
///          The fault itself travels on the InvocationContext, never on the signal.
struct FaultSignal
{
};
} // namespace detail

/// @brief Render the fatal report for @p fault.
/// @details Format:
///          "Fault @origin: description"
///          "  unwind: a -> b -> c"
///          "  superseded: description (unwind: x -> y)" once per superseded fault.
std::string formatFaultReport(const ActiveFault &fault);

/// @brief Join a context path with " -> ".
std::string formatUnwindPath(const std::vector<std::string> &path);

/// @brief Thrown from the outermost invoke when FatalPolicy::Throw is active.
class UnrecoveredFault : public std::runtime_error
{
  public:
    explicit UnrecoveredFault(ActiveFault fault);

    /// @brief Fault that reached the outermost context.
    const ActiveFault &fault() const noexcept
    {
        return fault_;
    }

  private:
    ActiveFault fault_;
};

/// @brief Error value produced from a recovered fault payload.
struct RecoveredFault
{
    FaultPayload payload;

    std::string description() const;
};

/// @brief Convert a recovered payload into an expected-error value.
/// @details A payload that already holds a support::Error is returned as-is so
///          identity comparisons keep working across the conversion.
support::Error faultToError(FaultPayload payload);

} // namespace scopeline::core
