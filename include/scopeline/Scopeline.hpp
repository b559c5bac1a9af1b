//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/scopeline/Scopeline.hpp
// Purpose: Public entry point: deferred actions, faults and recovery, error
//          values, and the finalizer registry.
// Invariants: Re-exports the library types under the scopeline namespace without
//             changing their semantics.
// Ownership: Header only; no state.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/CallStack.hpp"
#include "core/Fault.hpp"
#include "core/InvocationContext.hpp"
#include "core/RuntimeConfig.hpp"
#include "core/ScopedLock.hpp"
#include "gc/FinalizerRegistry.hpp"
#include "gc/StableHandle.hpp"
#include "gc/TrackingHeap.hpp"
#include "support/Error.hpp"
#include "support/Expected.hpp"
#include "support/log.hpp"

namespace scopeline
{

using core::ActiveFault;
using core::CallStack;
using core::FatalPolicy;
using core::FaultKind;
using core::FaultPayload;
using core::FrameState;
using core::RuntimeConfig;
using core::RuntimeFault;
using core::Scope;
using core::UnrecoveredFault;

using core::faultToError;
using core::lockAndDefer;
using core::lockSharedAndDefer;
using core::raise;
using core::recover;

using gc::FinalizerRegistry;
using gc::StableHandle;
using gc::TrackingHeap;

using gc::bindFinalizer;

using support::Error;
using support::errorAs;
using support::errorIs;
using support::Expected;

} // namespace scopeline
