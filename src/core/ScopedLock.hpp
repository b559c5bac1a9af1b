//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/ScopedLock.hpp
// Purpose: Acquire-then-defer-release helpers built on Scope::defer.
// Key invariants: The release is scheduled immediately after the acquisition
//                 succeeds, before anything that could fail, so it runs on every
//                 exit path including fault unwinds.
// Ownership/Lifetime: The lock object must outlive the invocation that locked it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/CallStack.hpp"

namespace scopeline::core
{

/// @brief Lock @p lock and defer its unlock on @p scope.
/// @tparam Lockable Any type with lock()/unlock(), e.g. std::mutex.
template <typename Lockable> void lockAndDefer(Scope &scope, Lockable &lock)
{
    lock.lock();
    try
    {
        scope.defer([&lock] { lock.unlock(); });
    }
    catch (...)
    {
        // Scheduling failed (allocation); release before reporting it.
        lock.unlock();
        throw;
    }
}

/// @brief Shared-lock @p lock and defer its unlock_shared on @p scope.
/// @tparam SharedLockable Any type with lock_shared()/unlock_shared().
template <typename SharedLockable> void lockSharedAndDefer(Scope &scope, SharedLockable &lock)
{
    lock.lock_shared();
    try
    {
        scope.defer([&lock] { lock.unlock_shared(); });
    }
    catch (...)
    {
        lock.unlock_shared();
        throw;
    }
}

} // namespace scopeline::core
