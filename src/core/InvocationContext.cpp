//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the per-context deferred call stack.  Entries are popped before
// they execute so a re-entrant drain (an entry scheduling more entries) never
// runs one twice.  Faults raised by an entry are attached to the context and do
// not stop the drain: the remaining entries execute under the active fault.
//
//===----------------------------------------------------------------------===//

#include "core/InvocationContext.hpp"

#include "support/log.hpp"

#include <stdexcept>

namespace scopeline::core
{

namespace
{

/// @brief RAII helper marking a context as executing a deferred entry.
/// @invariant Restores the previous flag value on destruction.
struct RunningDeferredGuard
{
    explicit RunningDeferredGuard(bool &flag) : flag(flag), previous(flag)
    {
        flag = true;
    }

    ~RunningDeferredGuard()
    {
        flag = previous;
    }

    bool &flag;
    bool previous;
};

} // namespace

DeferredEntry::DeferredEntry(Action action) : action_(std::move(action))
{
    if (!action_)
        throw std::invalid_argument("deferred entry requires a callable action");
}

void DeferredEntry::run()
{
    if (!action_)
        throw std::logic_error("deferred entry already consumed");
    Action action = std::move(action_);
    action_ = nullptr;
    action();
}

InvocationContext::InvocationContext(std::string name, InvocationContext *parent)
    : name_(std::move(name)), parent_(parent)
{
}

void InvocationContext::schedule(DeferredEntry entry)
{
    if (exited_)
        throw std::logic_error("cannot defer on exited context '" + name_ + "'");
    entries_.push_back(std::move(entry));
}

bool InvocationContext::install(ActiveFault fault)
{
    bool replaced = false;
    if (fault_)
    {
        supersede(fault, std::move(*fault_));
        replaced = true;
    }
    fault_ = std::move(fault);
    state_ = FrameState::Unwinding;
    return replaced;
}

bool InvocationContext::raiseHere(FaultPayload payload)
{
    ActiveFault fault{std::move(payload), name_, {name_}, {}};
    return install(std::move(fault));
}

bool InvocationContext::adoptFault(ActiveFault fault)
{
    fault.path.push_back(name_);
    return install(std::move(fault));
}

std::optional<FaultPayload> InvocationContext::recover()
{
    if (!runningDeferred_ || !fault_)
        return std::nullopt;
    if (!fault_->superseded.empty() && support::logEnabled(support::LogLevel::Debug))
    {
        for (const auto &old : fault_->superseded)
            support::log(support::LogLevel::Debug,
                         "unwind",
                         "recovery in '" + name_ + "' also clears superseded fault: " +
                             old.payload.description() + " (unwind: " + formatUnwindPath(old.path) + ")");
    }
    FaultPayload payload = std::move(fault_->payload);
    fault_.reset();
    state_ = FrameState::Recovered;
    return payload;
}

ActiveFault InvocationContext::takeFault()
{
    if (!fault_)
        throw std::logic_error("context '" + name_ + "' has no active fault");
    ActiveFault fault = std::move(*fault_);
    fault_.reset();
    return fault;
}

std::size_t InvocationContext::drain()
{
    if (exited_)
        throw std::logic_error("context '" + name_ + "' already drained");

    std::size_t executed = 0;
    while (!entries_.empty())
    {
        DeferredEntry entry = std::move(entries_.back());
        entries_.pop_back();
        RunningDeferredGuard guard(runningDeferred_);
        try
        {
            entry.run();
        }
        catch (const detail::FaultSignal &)
        {
            // Fault already attached to this context by raise or propagation.
        }
        catch (const std::exception &ex)
        {
            raiseHere(FaultPayload(RuntimeFault{FaultKind::ForeignException, ex.what()}));
        }
        catch (...)
        {
            raiseHere(
                FaultPayload(RuntimeFault{FaultKind::ForeignException, "non-standard exception"}));
        }
        ++executed;
    }
    exited_ = true;
    return executed;
}

} // namespace scopeline::core
