//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/RuntimeConfig.hpp
// Purpose: Configuration for a CallStack: fatal policy, depth limit, tracing.
// Key invariants: Unrecognised environment values leave the defaults untouched.
// Ownership/Lifetime: Value type; copied into each CallStack.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Fault.hpp"

#include <cstddef>
#include <functional>

namespace scopeline::core
{

/// @brief What happens when a fault reaches the outermost context.
enum class FatalPolicy
{
    Terminate, ///< Print the report to stderr and exit the process.
    Throw,     ///< Throw UnrecoveredFault out of the outermost invoke.
};

/// @brief Default process exit status for fatal faults.
inline constexpr int kDefaultFatalExitCode = 2;

/// @brief Settings consumed by CallStack.
struct RuntimeConfig
{
    /// @brief Fatal fault handling.
    FatalPolicy fatalPolicy = FatalPolicy::Terminate;

    /// @brief Exit status used by FatalPolicy::Terminate.
    int fatalExitCode = kDefaultFatalExitCode;

    /// @brief Maximum number of nested invocations; 0 disables the limit.
    std::size_t maxDepth = 0;

    /// @brief Log unwind events at Info instead of Debug.
    bool traceUnwind = false;

    /// @brief Observer called with the fatal fault before the policy applies.
    /// @note Must not raise faults; exceptions it throws are logged and ignored.
    std::function<void(const ActiveFault &)> fatalHook;

    /// @brief Defaults overlaid with SCOPELINE_* environment variables.
    static RuntimeConfig fromEnvironment();

    /// @brief Overlay SCOPELINE_* environment variables onto this config.
    /// @details Reads SCOPELINE_FATAL_POLICY (terminate|throw),
    ///          SCOPELINE_FATAL_EXIT_CODE, SCOPELINE_MAX_DEPTH and
    ///          SCOPELINE_TRACE_UNWIND (1/true/on, 0/false/off).
    void applyEnvironment();
};

} // namespace scopeline::core
