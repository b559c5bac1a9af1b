//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/InvocationContext.hpp
// Purpose: One logical unit of execution and its deferred call stack.
// Key invariants: Deferred entries run last-registered-first; each runs at most
//                 once; drain() runs exactly once per context. At most one active
//                 fault is attached at a time; replacing it records the old one as
//                 superseded.
// Ownership/Lifetime: Owned by the invoking CallStack frame (a stack object inside
//                     CallStack::invoke); the parent pointer is non-owning.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Fault.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace scopeline::core
{

/// @brief Unwind state of a single context.
enum class FrameState
{
    Normal,    ///< No fault attached.
    Unwinding, ///< A fault is attached and the deferred stack drains under it.
    Recovered, ///< A deferred action cleared the fault; exit completes normally.
};

constexpr std::string_view toString(FrameState state) noexcept
{
    switch (state)
    {
        case FrameState::Normal:
            return "Normal";
        case FrameState::Unwinding:
            return "Unwinding";
        case FrameState::Recovered:
            return "Recovered";
    }
    return "Normal";
}

/// @brief A scheduled cleanup action with its arguments already bound.
/// @invariant Immutable after construction; run() consumes it.
class DeferredEntry
{
  public:
    using Action = std::function<void()>;

    /// @throws std::invalid_argument when @p action is empty.
    explicit DeferredEntry(Action action);

    /// @brief Execute and consume the action.
    /// @throws std::logic_error when the entry was already consumed.
    void run();

    /// @brief True until run() has been called.
    [[nodiscard]] bool pending() const noexcept
    {
        return static_cast<bool>(action_);
    }

  private:
    Action action_;
};

/// @brief Bind @p fn and a by-value snapshot of @p args into a DeferredEntry.
/// @details Arguments are decayed and copied now; the action body runs later.
///          Pass std::ref(x) to bind a reference instead. Any value returned by
///          @p fn is discarded.
template <typename F, typename... Args> DeferredEntry bindDeferred(F &&fn, Args &&...args)
{
    return DeferredEntry(
        [action = std::decay_t<F>(std::forward<F>(fn)),
         bound = std::make_tuple(std::decay_t<Args>(std::forward<Args>(args))...)]() mutable
        { static_cast<void>(std::apply(action, bound)); });
}

/// @brief One call frame: deferred entries, parent link and active fault.
class InvocationContext
{
  public:
    InvocationContext(std::string name, InvocationContext *parent);

    InvocationContext(const InvocationContext &) = delete;
    InvocationContext &operator=(const InvocationContext &) = delete;

    const std::string &name() const noexcept
    {
        return name_;
    }

    InvocationContext *parent() const noexcept
    {
        return parent_;
    }

    FrameState state() const noexcept
    {
        return state_;
    }

    /// @brief True while one of this context's deferred entries is executing.
    bool runningDeferred() const noexcept
    {
        return runningDeferred_;
    }

    /// @brief True once drain() has completed.
    bool exited() const noexcept
    {
        return exited_;
    }

    /// @brief Push @p entry onto the deferred stack.
    /// @details Scheduling while draining is allowed; the entry runs next.
    /// @throws std::logic_error after the context has exited.
    void schedule(DeferredEntry entry);

    /// @brief Number of entries not yet executed.
    std::size_t pendingCount() const noexcept
    {
        return entries_.size();
    }

    /// @brief Attach a fault raised while this context is innermost.
    /// @return True when an existing fault was superseded.
    bool raiseHere(FaultPayload payload);

    /// @brief Attach a fault propagated out of a child context.
    /// @return True when an existing fault was superseded.
    bool adoptFault(ActiveFault fault);

    /// @brief Clear the active fault if called from a deferred entry.
    /// @return The cleared payload, or std::nullopt when no deferred entry of
    ///         this context is executing or no fault is attached.
    std::optional<FaultPayload> recover();

    const ActiveFault *activeFault() const noexcept
    {
        return fault_ ? &*fault_ : nullptr;
    }

    bool hasFault() const noexcept
    {
        return fault_.has_value();
    }

    /// @brief Detach the active fault for propagation; requires hasFault().
    ActiveFault takeFault();

    /// @brief Execute every deferred entry in reverse registration order.
    /// @details Faults raised by an entry (including C++ exceptions escaping it)
    ///          attach to this context and draining continues with the remaining
    ///          entries, which then run under the active fault.
    /// @return Number of entries executed.
    /// @throws std::logic_error when called a second time.
    std::size_t drain();

  private:
    bool install(ActiveFault fault);

    std::string name_;
    InvocationContext *parent_ = nullptr;
    std::vector<DeferredEntry> entries_;
    std::optional<ActiveFault> fault_;
    FrameState state_ = FrameState::Normal;
    bool runningDeferred_ = false;
    bool exited_ = false;
};

} // namespace scopeline::core
