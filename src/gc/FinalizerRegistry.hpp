//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gc/FinalizerRegistry.hpp
// Purpose: Finalizer table consulted by a memory manager when objects become
//          unreachable.
// Key invariants:
//   - At most one binding per object; registering again replaces the cleanup.
//   - A binding runs at most once and is removed before its cleanup executes.
//   - No ordering is guaranteed between the cleanups of different objects, and
//     cleanups may run on any thread (typically a background sweep).
//   - Cleanups run without the registry lock held; they may register or cancel
//     other finalizers.
// Ownership/Lifetime: The registry owns the cleanup callables, never the objects;
//                     object pointers are used only as keys.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace scopeline::gc
{

/// @brief Cleanup action attached to an object.
/// @details Must operate through a stable handle to the resource (see
///          StableHandle), never through the object being finalized, and must be
///          safe to run concurrently with arbitrary application code.
using Cleanup = std::function<void()>;

/// @brief Thread-safe finalizer table driven by reachability notifications.
/// @note This is a fallback for resources with diffuse ownership. Resources with
///       a clear owner are released through Scope::defer instead.
class FinalizerRegistry
{
  public:
    FinalizerRegistry() = default;
    FinalizerRegistry(const FinalizerRegistry &) = delete;
    FinalizerRegistry &operator=(const FinalizerRegistry &) = delete;

    /// @brief Bind @p cleanup to @p object.
    /// @throws std::invalid_argument for a null object or empty cleanup.
    void registerFinalizer(const void *object, Cleanup cleanup);

    /// @brief Remove the binding for @p object without running it.
    /// @return True when a binding existed.
    bool cancel(const void *object);

    /// @brief Memory manager notification: @p object is unreachable.
    /// @return True when a cleanup was bound and has now run.
    bool notifyUnreachable(const void *object);

    /// @brief Run every pending cleanup once (shutdown path).
    /// @return Number of cleanups executed.
    std::size_t runAll();

    /// @brief Whether @p object currently has a binding.
    bool isRegistered(const void *object) const;

    /// @brief Number of bindings not yet run or cancelled.
    std::size_t pendingCount() const;

    /// @brief Number of cleanups that threw.
    std::size_t failureCount() const noexcept
    {
        return failures_.load(std::memory_order_relaxed);
    }

  private:
    void runCleanup(const void *object, Cleanup &cleanup);

    mutable std::mutex mutex_;
    std::unordered_map<const void *, Cleanup> table_;
    std::atomic<std::size_t> failures_{0};
};

} // namespace scopeline::gc
