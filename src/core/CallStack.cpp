//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the fault propagation controller.  A raised fault is attached to
// the innermost context and the unwind signal is thrown.  Each invoke catches
// the signal at its boundary, drains its deferred stack under the fault, and
// either stops (recovered) or moves the fault to its parent and rethrows.  The
// outermost context hands unrecovered faults to the fatal path.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Fault propagation, recovery, and fatal reporting for CallStack.
/// @details The thread-local active stack pointer mirrors the way the
///          interpreter tracks its active VM: it lets free functions such as
///          scopeline::core::raise reach the right chain without hidden global
///          state shared across threads.

#include "core/CallStack.hpp"

#include "support/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace scopeline::core
{

namespace
{
thread_local CallStack *tlsActiveStack = nullptr;

constexpr std::string_view kLogComponent = "unwind";
} // namespace

CallStack::ActiveStackGuard::ActiveStackGuard(CallStack *stack) : previous(tlsActiveStack)
{
    tlsActiveStack = stack;
}

CallStack::ActiveStackGuard::~ActiveStackGuard()
{
    tlsActiveStack = previous;
}

CallStack *CallStack::active() noexcept
{
    return tlsActiveStack;
}

CallStack::CallStack(RuntimeConfig config) : config_(std::move(config)) {}

/// @brief Emit an unwind trace line at the configured verbosity.
void CallStack::trace(const std::string &message) const
{
    const auto level = config_.traceUnwind ? support::LogLevel::Info : support::LogLevel::Debug;
    if (support::logEnabled(level))
        support::log(level, kLogComponent, message);
}

/// @brief Link @p context as the innermost context.
/// @details When the depth limit would be exceeded the caller's context receives
///          a DepthExceeded fault instead and the new context is never entered.
void CallStack::enter(InvocationContext &context)
{
    if (config_.maxDepth != 0 && depth_ >= config_.maxDepth)
    {
        raise(RuntimeFault{FaultKind::DepthExceeded,
                           "entering '" + context.name() + "' would exceed depth " +
                               std::to_string(config_.maxDepth)});
    }
    top_ = &context;
    ++depth_;
    trace("enter '" + context.name() + "' depth=" + std::to_string(depth_));
}

/// @brief Drain @p context, unlink it, and settle its fault.
/// @details Runs on every exit path.  If a fault is still attached after the
///          drain it moves to the parent and the unwind signal is rethrown; with
///          no parent the fault is fatal.
void CallStack::leave(InvocationContext &context)
{
    const std::size_t executed = context.drain();
    top_ = context.parent();
    --depth_;

    if (!context.hasFault())
    {
        if (context.state() == FrameState::Recovered)
            trace("'" + context.name() + "' recovered after " + std::to_string(executed) +
                  " deferred action(s)");
        return;
    }

    ActiveFault fault = context.takeFault();
    trace("'" + context.name() + "' unwound after " + std::to_string(executed) +
          " deferred action(s): " + fault.payload.description());

    if (InvocationContext *parent = top_)
    {
        if (parent->adoptFault(std::move(fault)))
            trace("fault propagated into '" + parent->name() + "' superseded its active fault");
        throw detail::FaultSignal{};
    }
    fatal(std::move(fault));
}

/// @brief Convert an escaped C++ exception into a fault on @p context.
void CallStack::captureForeign(InvocationContext &context, std::exception_ptr error)
{
    std::string what = "non-standard exception";
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &ex)
    {
        what = ex.what();
    }
    catch (...)
    {
        // Non-standard type: keep the generic description.
    }
    trace("foreign exception in '" + context.name() + "': " + what);
    context.raiseHere(FaultPayload(RuntimeFault{FaultKind::ForeignException, std::move(what)}));
}

void CallStack::raisePayload(FaultPayload payload)
{
    if (!top_)
    {
        ActiveFault fault{std::move(payload), std::string(), {}, {}};
        fatal(std::move(fault));
    }

    trace("raise in '" + top_->name() + "': " + payload.description());
    if (top_->raiseHere(std::move(payload)))
        trace("fault in '" + top_->name() + "' superseded the fault being unwound");
    throw detail::FaultSignal{};
}

std::optional<FaultPayload> CallStack::recover()
{
    if (!top_)
        return std::nullopt;
    if (!top_->runningDeferred())
    {
        trace("recover ignored in '" + top_->name() + "': not inside a deferred action");
        return std::nullopt;
    }
    auto payload = top_->recover();
    if (payload)
        trace("recovered in '" + top_->name() + "': " + payload->description());
    return payload;
}

std::optional<FaultPayload> Scope::recover()
{
    if (stack_.current() != &context_)
        return std::nullopt;
    return stack_.recover();
}

/// @brief Report a fault that left the outermost context and apply the policy.
/// @details The hook runs first so embedders can capture the report.  With
///          FatalPolicy::Terminate the report is written to stderr and the
///          process exits without running further destructors, matching how the
///          runtime trap hook terminates.
void CallStack::fatal(ActiveFault fault)
{
    if (config_.fatalHook)
    {
        try
        {
            config_.fatalHook(fault);
        }
        catch (const std::exception &ex)
        {
            support::log(support::LogLevel::Error,
                         kLogComponent,
                         std::string("fatal hook threw: ") + ex.what());
        }
    }

    if (config_.fatalPolicy == FatalPolicy::Throw)
        throw UnrecoveredFault(std::move(fault));

    const std::string report = formatFaultReport(fault);
    std::fprintf(stderr, "fatal: %s\n", report.c_str());
    std::fflush(stderr);
    std::_Exit(config_.fatalExitCode);
}

std::optional<FaultPayload> recover()
{
    if (CallStack *stack = CallStack::active())
        return stack->recover();
    return std::nullopt;
}

} // namespace scopeline::core
