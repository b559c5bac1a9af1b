//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gc/TrackingHeap.cpp
// Purpose: Mark-sweep pass, root/edge bookkeeping and the background sweeper for
// TrackingHeap.
//
// Key invariants:
//   - Unreachable nodes are detached from the graph under the lock, so concurrent
//     collect() calls never finalize or free the same object twice.
//   - Finalizers and deleters run after the lock is released.
//
// Ownership/Lifetime:
//   - Detached objects are owned by the sweeping thread until freed.
//
// Links: gc/TrackingHeap.hpp
//
//===----------------------------------------------------------------------===//

#include "gc/TrackingHeap.hpp"

#include "support/log.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

namespace scopeline::gc
{

namespace
{
constexpr std::string_view kLogComponent = "gc";
} // namespace

TrackingHeap::~TrackingHeap()
{
    stopBackgroundSweep();

    // Shutdown: pending finalizers run once, then every remaining object is freed.
    registry_.runAll();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[object, node] : nodes_)
        node.destroy(const_cast<void *>(object));
    nodes_.clear();
}

void TrackingHeap::adopt(void *object, Deleter destroy, std::size_t roots)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Node node;
    node.destroy = destroy;
    node.roots = roots;
    nodes_.emplace(object, std::move(node));
}

/// @brief Look up the node for @p object; caller holds the lock.
TrackingHeap::Node &TrackingHeap::nodeFor(const void *object)
{
    auto it = nodes_.find(object);
    if (it == nodes_.end())
        throw std::invalid_argument("object is not owned by this heap");
    return it->second;
}

void TrackingHeap::addRoot(const void *object)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++nodeFor(object).roots;
}

void TrackingHeap::removeRoot(const void *object)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Node &node = nodeFor(object);
    if (node.roots == 0)
        throw std::logic_error("removeRoot without matching addRoot");
    --node.roots;
}

void TrackingHeap::link(const void *from, const void *to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    nodeFor(to);
    nodeFor(from).edges.push_back(to);
}

bool TrackingHeap::unlink(const void *from, const void *to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &edges = nodeFor(from).edges;
    for (auto it = edges.begin(); it != edges.end(); ++it)
    {
        if (*it == to)
        {
            edges.erase(it);
            return true;
        }
    }
    return false;
}

/// @details The binding is inserted while the heap lock is held so a concurrent
///          collect() cannot free @p object between the ownership check and the
///          insert.  Lock order is heap then registry; collect() never holds both.
void TrackingHeap::registerFinalizer(const void *object, Cleanup cleanup)
{
    std::lock_guard<std::mutex> lock(mutex_);
    nodeFor(object);
    registry_.registerFinalizer(object, std::move(cleanup));
}

std::size_t TrackingHeap::collect()
{
    std::vector<std::pair<const void *, Deleter>> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::unordered_set<const void *> marked;
        std::vector<const void *> work;
        for (const auto &[object, node] : nodes_)
        {
            if (node.roots > 0 && marked.insert(object).second)
                work.push_back(object);
        }
        while (!work.empty())
        {
            const void *cur = work.back();
            work.pop_back();
            for (const void *child : nodes_.at(cur).edges)
            {
                // Edges may point at objects freed by an earlier pass.
                if (nodes_.count(child) && marked.insert(child).second)
                    work.push_back(child);
            }
        }

        for (auto it = nodes_.begin(); it != nodes_.end();)
        {
            if (marked.count(it->first))
            {
                ++it;
                continue;
            }
            dead.emplace_back(it->first, it->second.destroy);
            it = nodes_.erase(it);
        }
        ++passes_;
    }

    for (const auto &[object, destroy] : dead)
        registry_.notifyUnreachable(object);
    for (const auto &[object, destroy] : dead)
        destroy(const_cast<void *>(object));

    if (!dead.empty() && support::logEnabled(support::LogLevel::Debug))
        support::log(
            support::LogLevel::Debug, kLogComponent, "freed " + std::to_string(dead.size()) + " object(s)");
    return dead.size();
}

void TrackingHeap::startBackgroundSweep(std::chrono::milliseconds interval)
{
    stopBackgroundSweep();
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        sweepStop_ = false;
    }
    sweeper_ = std::thread([this, interval] { sweeperLoop(interval); });
}

void TrackingHeap::stopBackgroundSweep()
{
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        sweepStop_ = true;
    }
    sweepWake_.notify_all();
    if (sweeper_.joinable())
        sweeper_.join();
}

void TrackingHeap::sweeperLoop(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(sweepMutex_);
    while (!sweepStop_)
    {
        if (sweepWake_.wait_for(lock, interval, [this] { return sweepStop_; }))
            break;
        lock.unlock();
        collect();
        lock.lock();
    }
}

bool TrackingHeap::isLive(const void *object) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.count(object) != 0;
}

std::size_t TrackingHeap::liveCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

uint64_t TrackingHeap::passCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return passes_;
}

} // namespace scopeline::gc
