//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gc/StableHandle.hpp
// Purpose: Shared indirection to a resource so cleanup never depends on the
//          wrapper object that exposes it.
// Key invariants: All copies of a handle refer to one cell; release() runs its
//                 action at most once across every copy and every thread.
// Ownership/Lifetime: The cell lives as long as any copy (wrapper or finalizer).
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gc/FinalizerRegistry.hpp"

#include <atomic>
#include <memory>
#include <utility>

namespace scopeline::gc
{

/// @brief Copyable handle to a resource with idempotent release.
template <typename T> class StableHandle
{
  public:
    explicit StableHandle(T resource) : cell_(std::make_shared<Cell>(std::move(resource))) {}

    /// @brief Access the resource.
    T &get() const noexcept
    {
        return cell_->resource;
    }

    /// @brief Whether release() has already run for this resource.
    bool released() const noexcept
    {
        return cell_->released.load(std::memory_order_acquire);
    }

    /// @brief Run @p action on the resource unless a release already ran.
    /// @return True when this call performed the release.
    template <typename Fn> bool release(Fn &&action) const
    {
        if (cell_->released.exchange(true, std::memory_order_acq_rel))
            return false;
        std::forward<Fn>(action)(cell_->resource);
        return true;
    }

    /// @brief Number of handles sharing the cell.
    long useCount() const noexcept
    {
        return cell_.use_count();
    }

  private:
    struct Cell
    {
        explicit Cell(T r) : resource(std::move(r)) {}

        T resource;
        std::atomic<bool> released{false};
    };

    std::shared_ptr<Cell> cell_;
};

/// @brief Register a finalizer on @p owner that releases @p handle.
/// @details The cleanup captures a copy of the handle, not @p owner, so the
///          resource is released correctly even when the owner has already been
///          destroyed or overwritten.
template <typename T, typename Fn>
void bindFinalizer(FinalizerRegistry &registry, const void *owner, const StableHandle<T> &handle, Fn release)
{
    registry.registerFinalizer(owner, [handle, release]() mutable { handle.release(release); });
}

} // namespace scopeline::gc
