//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/DeferredStackTests.cpp
// Purpose: Validate deferred action ordering, argument capture, and the
//          drain-once contract of invocation contexts.
// Key invariants: Entries run last-registered-first on normal return, early
//                 return and fault unwind; bound arguments are frozen at defer time.
// Ownership/Lifetime: Each test owns its CallStack and captured state.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/CallStack.hpp"
#include "core/InvocationContext.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scopeline::core;

namespace
{
using Trail = std::vector<std::string>;

RuntimeConfig throwingConfig()
{
    RuntimeConfig config;
    config.fatalPolicy = FatalPolicy::Throw;
    return config;
}

void record(Trail *trail, std::string label)
{
    trail->push_back(std::move(label));
}
} // namespace

TEST(DeferredStack, RunsInReverseOnNormalExit)
{
    CallStack stack(throwingConfig());
    Trail order;
    stack.invoke("main",
                 [&](Scope &scope)
                 {
                     scope.defer([&] { order.push_back("A"); });
                     scope.defer([&] { order.push_back("B"); });
                     scope.defer([&] { order.push_back("C"); });
                     EXPECT_EQ(scope.pendingDeferred(), 3u);
                     EXPECT_TRUE(order.empty());
                 });
    EXPECT_EQ(order, (Trail{"C", "B", "A"}));
    EXPECT_EQ(stack.depth(), 0u);
}

TEST(DeferredStack, RunsInReverseOnEarlyReturn)
{
    CallStack stack(throwingConfig());
    Trail order;
    bool stopEarly = true;
    int result = stack.invoke("early",
                              [&](Scope &scope) -> int
                              {
                                  scope.defer(record, &order, std::string("A"));
                                  scope.defer(record, &order, std::string("B"));
                                  if (stopEarly)
                                      return 7;
                                  scope.defer(record, &order, std::string("never"));
                                  return 0;
                              });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(order, (Trail{"B", "A"}));
}

TEST(DeferredStack, RunsInReverseDuringFaultUnwind)
{
    CallStack stack(throwingConfig());
    Trail order;
    stack.invoke("outer",
                 [&](Scope &outer)
                 {
                     outer.defer(
                         [&]
                         {
                             order.push_back("outer");
                             outer.recover();
                         });
                     stack.invoke("inner",
                                  [&](Scope &scope)
                                  {
                                      scope.defer([&] { order.push_back("A"); });
                                      scope.defer([&] { order.push_back("B"); });
                                      scope.defer([&] { order.push_back("C"); });
                                      scope.raise(std::string("boom"));
                                  });
                     order.push_back("after inner");
                 });
    EXPECT_EQ(order, (Trail{"C", "B", "A", "outer"}));
}

TEST(DeferredStack, BoundArgumentsAreFrozenAtDeferTime)
{
    CallStack stack(throwingConfig());
    int byValue = 0;
    int byReference = 0;
    int byStdRef = 0;
    int counter = 1;
    stack.invoke("capture",
                 [&](Scope &scope)
                 {
                     scope.defer([&byValue](int seen) { byValue = seen; }, counter);
                     scope.defer([&] { byReference = counter; });
                     scope.defer([&byStdRef](int &seen) { byStdRef = seen; }, std::ref(counter));
                     counter = 2;
                 });
    EXPECT_EQ(byValue, 1);
    EXPECT_EQ(byReference, 2);
    EXPECT_EQ(byStdRef, 2);
}

TEST(DeferredStack, BoundStringIsCopiedNotAliased)
{
    CallStack stack(throwingConfig());
    Trail order;
    stack.invoke("copy",
                 [&](Scope &scope)
                 {
                     std::string label = "first";
                     scope.defer(record, &order, label);
                     label = "second";
                     scope.defer(record, &order, label);
                 });
    EXPECT_EQ(order, (Trail{"second", "first"}));
}

TEST(DeferredStack, DeferDuringDrainRunsNext)
{
    CallStack stack(throwingConfig());
    Trail order;
    stack.invoke("nested-defer",
                 [&](Scope &scope)
                 {
                     scope.defer([&] { order.push_back("A"); });
                     scope.defer(
                         [&]
                         {
                             order.push_back("B");
                             scope.defer([&] { order.push_back("B2"); });
                         });
                 });
    EXPECT_EQ(order, (Trail{"B", "B2", "A"}));
}

TEST(DeferredStack, FaultInEntryStillRunsRemainingEntries)
{
    CallStack stack(throwingConfig());
    Trail order;
    EXPECT_THROW(stack.invoke("main",
                              [&](Scope &scope)
                              {
                                  scope.defer([&] { order.push_back("A"); });
                                  scope.defer(
                                      [&]
                                      {
                                          order.push_back("B");
                                          scope.raise(std::string("cleanup failed"));
                                      });
                                  scope.defer([&] { order.push_back("C"); });
                              }),
                 UnrecoveredFault);
    EXPECT_EQ(order, (Trail{"C", "B", "A"}));
}

TEST(DeferredStack, EntriesBelowFaultingEntryRunUnderTheFault)
{
    CallStack stack(throwingConfig());
    FrameState seen = FrameState::Normal;
    stack.invoke("main",
                 [&](Scope &scope)
                 {
                     scope.defer(
                         [&]
                         {
                             seen = scope.state();
                             scope.recover();
                         });
                     scope.defer([&] { scope.raise(42); });
                 });
    EXPECT_EQ(seen, FrameState::Unwinding);
}

TEST(DeferredStack, OuterEntriesRunAfterInnerCleanupFault)
{
    CallStack stack(throwingConfig());
    Trail order;
    EXPECT_THROW(stack.invoke("outer",
                              [&](Scope &outer)
                              {
                                  outer.defer([&] { order.push_back("outer-cleanup"); });
                                  stack.invoke("inner",
                                               [&](Scope &inner)
                                               { inner.defer([&] { inner.raise(1); }); });
                                  order.push_back("not reached");
                              }),
                 UnrecoveredFault);
    EXPECT_EQ(order, (Trail{"outer-cleanup"}));
}

TEST(DeferredStack, ContextStateIsInspectableWhileDraining)
{
    CallStack stack(throwingConfig());
    std::string drainingName;
    std::size_t depthWhileDraining = 0;
    stack.invoke("inspect",
                 [&](Scope &scope)
                 {
                     scope.defer(
                         [&]
                         {
                             drainingName = stack.current()->name();
                             depthWhileDraining = stack.depth();
                         });
                 });
    EXPECT_EQ(drainingName, "inspect");
    EXPECT_EQ(depthWhileDraining, 1u);
}

TEST(InvocationContext, DrainsExactlyOnce)
{
    InvocationContext context("ctx", nullptr);
    int runs = 0;
    context.schedule(bindDeferred([&runs] { ++runs; }));
    EXPECT_EQ(context.drain(), 1u);
    EXPECT_TRUE(context.exited());
    EXPECT_THROW(context.drain(), std::logic_error);
    EXPECT_THROW(context.schedule(bindDeferred([] {})), std::logic_error);
    EXPECT_EQ(runs, 1);
}

TEST(InvocationContext, EntryIsConsumedAtMostOnce)
{
    int runs = 0;
    DeferredEntry entry([&runs] { ++runs; });
    EXPECT_TRUE(entry.pending());
    entry.run();
    EXPECT_FALSE(entry.pending());
    EXPECT_THROW(entry.run(), std::logic_error);
    EXPECT_EQ(runs, 1);
}

TEST(InvocationContext, RejectsEmptyAction)
{
    EXPECT_THROW(DeferredEntry(DeferredEntry::Action{}), std::invalid_argument);
}

TEST(InvocationContext, ForeignExceptionInEntryBecomesFault)
{
    InvocationContext context("ctx", nullptr);
    context.schedule(bindDeferred([] { throw std::runtime_error("disk full"); }));
    context.drain();
    ASSERT_TRUE(context.hasFault());
    const auto *payload = context.activeFault()->payload.get<RuntimeFault>();
    ASSERT_NE(payload, nullptr);
    EXPECT_EQ(payload->kind, FaultKind::ForeignException);
    EXPECT_EQ(payload->message, "disk full");
    EXPECT_EQ(context.state(), FrameState::Unwinding);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
