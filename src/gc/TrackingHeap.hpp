//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gc/TrackingHeap.hpp
// Purpose: Reachability-tracking object heap that drives the finalizer registry:
// objects are reachable from explicit roots through explicit reference edges, and
// a mark-sweep pass finalizes and frees everything else.
//
// Key invariants:
//   - Only objects returned by allocate() may be rooted, linked or finalized.
//   - collect() finalizes an unreachable object before freeing it; the finalizer
//     never observes the object's memory being reused.
//   - Finalizers run outside the heap lock, in unspecified order, on whichever
//     thread runs the sweep (the caller or the background sweeper).
//   - Weak observers (isLive) never keep an object alive.
//
// Ownership/Lifetime:
//   - The heap owns every allocated object and frees it after finalization, or at
//     heap destruction.
//   - Root counts are explicit; addRoot/removeRoot calls must balance.
//
// Links: gc/FinalizerRegistry.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gc/FinalizerRegistry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scopeline::gc
{

/// @brief Minimal mark-sweep memory manager with finalizer support.
class TrackingHeap
{
  public:
    TrackingHeap() = default;
    ~TrackingHeap();

    TrackingHeap(const TrackingHeap &) = delete;
    TrackingHeap &operator=(const TrackingHeap &) = delete;

    /// @brief Construct a heap-owned @p T. The object starts unrooted.
    /// @note With a background sweep running the object may be collected before
    ///       this returns; use allocateRooted() there.
    template <typename T, typename... Args> T *allocate(Args &&...args)
    {
        return construct<T>(0, std::forward<Args>(args)...);
    }

    /// @brief Construct a heap-owned @p T holding one root.
    /// @details The root is taken under the heap lock, so no concurrent sweep can
    ///          free the object before the caller sees it.  Balance with
    ///          removeRoot() once the object is linked or no longer needed.
    template <typename T, typename... Args> T *allocateRooted(Args &&...args)
    {
        return construct<T>(1, std::forward<Args>(args)...);
    }

    /// @brief Increment the root count of @p object.
    void addRoot(const void *object);

    /// @brief Decrement the root count of @p object.
    void removeRoot(const void *object);

    /// @brief Record a strong reference from @p from to @p to.
    void link(const void *from, const void *to);

    /// @brief Remove one strong reference from @p from to @p to.
    /// @return True when such an edge existed.
    bool unlink(const void *from, const void *to);

    /// @brief Attach a finalizer to a heap object.
    /// @throws std::invalid_argument when @p object is not owned by this heap.
    void registerFinalizer(const void *object, Cleanup cleanup);

    /// @brief Run one mark-sweep pass.
    /// @return Number of objects freed.
    std::size_t collect();

    /// @brief Start a thread that calls collect() every @p interval.
    /// @details Calling it while a sweeper is running restarts it with the new
    ///          interval.
    void startBackgroundSweep(std::chrono::milliseconds interval);

    /// @brief Stop the background sweeper and wait for it to finish.
    void stopBackgroundSweep();

    /// @brief Whether @p object is still owned (not yet freed) by this heap.
    bool isLive(const void *object) const;

    std::size_t liveCount() const;

    /// @brief Number of completed collect() passes.
    uint64_t passCount() const;

    FinalizerRegistry &registry() noexcept
    {
        return registry_;
    }

  private:
    using Deleter = void (*)(void *);

    struct Node
    {
        Deleter destroy = nullptr;
        std::size_t roots = 0;
        std::vector<const void *> edges;
    };

    template <typename T, typename... Args> T *construct(std::size_t roots, Args &&...args)
    {
        auto owned = std::make_unique<T>(std::forward<Args>(args)...);
        T *raw = owned.get();
        adopt(raw, [](void *p) { delete static_cast<T *>(p); }, roots);
        owned.release();
        return raw;
    }

    void adopt(void *object, Deleter destroy, std::size_t roots);
    Node &nodeFor(const void *object);
    void sweeperLoop(std::chrono::milliseconds interval);

    mutable std::mutex mutex_;
    std::unordered_map<const void *, Node> nodes_;
    uint64_t passes_ = 0;
    FinalizerRegistry registry_;

    std::mutex sweepMutex_;
    std::condition_variable sweepWake_;
    bool sweepStop_ = false;
    std::thread sweeper_;
};

} // namespace scopeline::gc
