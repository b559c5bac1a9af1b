//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the finalizer table.  Bindings are detached under the lock and
// executed after it is released so cleanups can re-enter the registry and so a
// slow cleanup never blocks the memory manager's bookkeeping.
//
//===----------------------------------------------------------------------===//

#include "gc/FinalizerRegistry.hpp"

#include "support/log.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scopeline::gc
{

namespace
{
constexpr std::string_view kLogComponent = "finalizer";

std::string describeObject(const void *object)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%p", object);
    return buf;
}
} // namespace

void FinalizerRegistry::registerFinalizer(const void *object, Cleanup cleanup)
{
    if (!object)
        throw std::invalid_argument("registerFinalizer: null object");
    if (!cleanup)
        throw std::invalid_argument("registerFinalizer: empty cleanup");

    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = table_.insert_or_assign(object, std::move(cleanup));
        (void)it;
        replaced = !inserted;
    }
    if (replaced && support::logEnabled(support::LogLevel::Debug))
        support::log(support::LogLevel::Debug,
                     kLogComponent,
                     "replaced finalizer for " + describeObject(object));
}

bool FinalizerRegistry::cancel(const void *object)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.erase(object) != 0;
}

bool FinalizerRegistry::notifyUnreachable(const void *object)
{
    Cleanup cleanup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(object);
        if (it == table_.end())
            return false;
        cleanup = std::move(it->second);
        table_.erase(it);
    }
    runCleanup(object, cleanup);
    return true;
}

std::size_t FinalizerRegistry::runAll()
{
    std::vector<std::pair<const void *, Cleanup>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.reserve(table_.size());
        for (auto &entry : table_)
            pending.emplace_back(entry.first, std::move(entry.second));
        table_.clear();
    }
    for (auto &[object, cleanup] : pending)
        runCleanup(object, cleanup);
    return pending.size();
}

bool FinalizerRegistry::isRegistered(const void *object) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.count(object) != 0;
}

std::size_t FinalizerRegistry::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

/// @brief Execute one detached cleanup.
/// @details A throwing cleanup is logged and counted; it never stops the caller
///          from finalizing other objects.
void FinalizerRegistry::runCleanup(const void *object, Cleanup &cleanup)
{
    if (support::logEnabled(support::LogLevel::Debug))
        support::log(support::LogLevel::Debug, kLogComponent, "finalizing " + describeObject(object));
    try
    {
        cleanup();
    }
    catch (const std::exception &ex)
    {
        failures_.fetch_add(1, std::memory_order_relaxed);
        support::log(support::LogLevel::Error,
                     kLogComponent,
                     "cleanup for " + describeObject(object) + " threw: " + ex.what());
    }
    catch (...)
    {
        failures_.fetch_add(1, std::memory_order_relaxed);
        support::log(support::LogLevel::Error,
                     kLogComponent,
                     "cleanup for " + describeObject(object) + " threw a non-standard exception");
    }
}

} // namespace scopeline::gc
