//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/CallStack.hpp
// Purpose: Per-thread chain of invocation contexts: entering units of execution,
//          raising faults, propagating them outward, and recovering them.
// Key invariants: A CallStack is used by exactly one thread. Every invoke drains
//                 its context on every exit path before control leaves it. A fault
//                 leaving the outermost context is fatal; it is never swallowed.
// Ownership/Lifetime: Contexts live in the stack frames of CallStack::invoke; the
//                     CallStack only links them. Scope handles borrow both.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Fault.hpp"
#include "core/InvocationContext.hpp"
#include "core/RuntimeConfig.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace scopeline::core
{

class CallStack;

/// @brief Handle to the context of one running invocation.
/// @details Passed by reference to every body run through CallStack::invoke.
///          It must not outlive that invocation.
class Scope
{
  public:
    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;

    /// @brief Schedule @p fn to run when this invocation exits.
    /// @details @p args are copied now; @p fn may capture by reference to observe
    ///          values at execution time instead.  Locals of the body are gone by
    ///          the time deferred actions run, so bind those by value.
    template <typename F, typename... Args> void defer(F &&fn, Args &&...args)
    {
        context_.schedule(bindDeferred(std::forward<F>(fn), std::forward<Args>(args)...));
    }

    /// @brief Raise a fault carrying @p payload. Never returns.
    template <typename T> [[noreturn]] void raise(T &&payload);

    /// @brief Clear and return the fault this invocation is unwinding from.
    /// @details Effective only inside one of this invocation's deferred actions
    ///          while it is the innermost context. Anywhere else it returns
    ///          std::nullopt and has no effect.
    std::optional<FaultPayload> recover();

    const std::string &name() const noexcept
    {
        return context_.name();
    }

    FrameState state() const noexcept
    {
        return context_.state();
    }

    const ActiveFault *activeFault() const noexcept
    {
        return context_.activeFault();
    }

    std::size_t pendingDeferred() const noexcept
    {
        return context_.pendingCount();
    }

    CallStack &stack() const noexcept
    {
        return stack_;
    }

  private:
    friend class CallStack;

    Scope(CallStack &stack, InvocationContext &context) : stack_(stack), context_(context) {}

    CallStack &stack_;
    InvocationContext &context_;
};

/**
 * @brief Fault propagation controller for one thread of control.
 *
 * Each call to invoke() creates an InvocationContext linked to the current one,
 * runs the body, drains the context's deferred stack, and then either returns
 * normally (no fault, or a fault recovered by a deferred action) or hands the
 * fault to the enclosing context and keeps unwinding.  A fault leaving the
 * outermost context is fatal and handled per RuntimeConfig::fatalPolicy.
 *
 * A body or deferred action that catches everything with `catch (...)` and does
 * not rethrow will also stop the unwind signal; such handlers must rethrow.
 *
 * @invariant Only one thread uses a given CallStack.
 */
class CallStack
{
  public:
    explicit CallStack(RuntimeConfig config = RuntimeConfig::fromEnvironment());

    CallStack(const CallStack &) = delete;
    CallStack &operator=(const CallStack &) = delete;

    /// @brief Run @p body as a new unit of execution named @p name.
    /// @details The body receives a Scope for deferring, raising and recovering.
    ///          After a recovery the result is the body's value if it had already
    ///          returned one, otherwise a value-initialised R.
    /// @return Body result.
    /// @throws std::invalid_argument when @p body is an empty callable.
    template <typename Fn> auto invoke(std::string name, Fn &&body) -> std::invoke_result_t<Fn &, Scope &>
    {
        using R = std::invoke_result_t<Fn &, Scope &>;
        static_assert(std::is_void_v<R> || std::is_default_constructible_v<R>,
                      "invoke requires a default-constructible result for recovery");
        if constexpr (std::is_constructible_v<bool, Fn &>)
        {
            if (!static_cast<bool>(body))
                throw std::invalid_argument("invoke requires a non-empty body for '" + name + "'");
        }

        ActiveStackGuard active(this);
        InvocationContext context(std::move(name), top_);
        enter(context);
        Scope scope(*this, context);

        if constexpr (std::is_void_v<R>)
        {
            try
            {
                body(scope);
            }
            catch (const detail::FaultSignal &)
            {
                // Fault is attached to the context; leave() drains under it.
            }
            catch (...)
            {
                captureForeign(context, std::current_exception());
            }
            leave(context);
        }
        else
        {
            std::optional<R> result;
            try
            {
                result.emplace(body(scope));
            }
            catch (const detail::FaultSignal &)
            {
                // Fault is attached to the context; leave() drains under it.
            }
            catch (...)
            {
                captureForeign(context, std::current_exception());
            }
            leave(context);
            if (result)
                return std::move(*result);
            return R{};
        }
    }

    /// @brief Raise a fault in the innermost context. Never returns.
    template <typename T> [[noreturn]] void raise(T &&payload)
    {
        if constexpr (std::is_same_v<std::decay_t<T>, FaultPayload>)
            raisePayload(std::forward<T>(payload));
        else
            raisePayload(FaultPayload(std::forward<T>(payload)));
    }

    /// @brief Raise @p payload in the innermost context. Never returns.
    [[noreturn]] void raisePayload(FaultPayload payload);

    /// @brief Recover the innermost context's fault from inside its deferred action.
    /// @return Cleared payload, or std::nullopt when recovery is not possible here.
    std::optional<FaultPayload> recover();

    /// @brief Number of contexts currently on the chain.
    std::size_t depth() const noexcept
    {
        return depth_;
    }

    /// @brief Innermost context, or nullptr when nothing is running.
    InvocationContext *current() const noexcept
    {
        return top_;
    }

    const RuntimeConfig &config() const noexcept
    {
        return config_;
    }

    /// @brief CallStack currently executing on the calling thread, if any.
    static CallStack *active() noexcept;

  private:
    /// @brief RAII helper installing the active CallStack for the calling thread.
    /// @invariant Restores the previous active stack on destruction.
    struct ActiveStackGuard
    {
        explicit ActiveStackGuard(CallStack *stack);
        ~ActiveStackGuard();

        ActiveStackGuard(const ActiveStackGuard &) = delete;
        ActiveStackGuard &operator=(const ActiveStackGuard &) = delete;

      private:
        CallStack *previous = nullptr;
    };

    void enter(InvocationContext &context);
    void leave(InvocationContext &context);
    void captureForeign(InvocationContext &context, std::exception_ptr error);
    [[noreturn]] void fatal(ActiveFault fault);
    void trace(const std::string &message) const;

    RuntimeConfig config_;
    InvocationContext *top_ = nullptr;
    std::size_t depth_ = 0;
};

template <typename T> void Scope::raise(T &&payload)
{
    stack_.raise(std::forward<T>(payload));
}

/// @brief Raise a fault on the calling thread's active CallStack.
/// @details Outside any invocation the fault is immediately fatal.
template <typename T> [[noreturn]] void raise(T &&payload)
{
    if (CallStack *stack = CallStack::active())
        stack->raise(std::forward<T>(payload));
    CallStack detached;
    detached.raise(std::forward<T>(payload));
}

/// @brief Recover on the calling thread's active CallStack.
/// @return std::nullopt outside any invocation or outside a deferred action.
std::optional<FaultPayload> recover();

} // namespace scopeline::core
