//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/DebugActorTests.cpp
// Purpose: Drive the DebugActor pause/step state machine through breakpoints,
//          stepping commands and resolver halts.
// Key invariants: A breakpointed message never executes before a step or
//                 resume; released messages keep their FIFO order.
// Ownership/Lifetime: Standalone executable.
// Links: src/debug/DebugActor.hpp, src/debug/DebugSession.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/common/ActorFixture.hpp"

#include "actors/Actor.hpp"
#include "debug/DebugActor.hpp"
#include "debug/DebugSession.hpp"
#include "strand/Runtime.hpp"
#include "support/source_manager.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace strand;
using namespace strand::actors;
using namespace strand::debug;
using strand::tests::asInt;
using strand::tests::intValue;
using strand::tests::RuntimeHarness;

namespace
{

class DebugActorTest : public ::testing::Test
{
  protected:
    DebugActorTest() : h(RuntimeHarness::debugging())
    {
        origin = rt().sources().addOrigin("app/main.st");
        echo = rt().selector("echo:");
        value = rt().selector("value:");
        h.interpreter.on(echo, [](const Value &, const std::vector<Value> &args, Actor &) { return args.at(0); });
        h.interpreter.on(value, [](const Value &, const std::vector<Value> &args, Actor &) { return args.at(0); });
    }

    Runtime &rt()
    {
        return *h.runtime;
    }

    DebugSession &session()
    {
        return *rt().debugSession();
    }

    support::SourceLocation at(uint32_t line, uint32_t column = 1)
    {
        return {origin, line, column, line * 100 + column};
    }

    std::shared_ptr<DebugActor> spawnAttached(const std::string &name)
    {
        auto actor = rt().debugActor(rt().spawn(name));
        actor->attach();
        return actor;
    }

    PromiseRef send(const std::shared_ptr<DebugActor> &target, int64_t n, support::SourceLocation site = {})
    {
        return rt().eventualSend(target, Nil{}, echo, {intValue(n)}, site);
    }

    std::vector<int64_t> echoed() const
    {
        std::vector<int64_t> out;
        for (const auto &call : h.interpreter.calls())
        {
            if (call.selector == echo)
                out.push_back(asInt(call.args.at(0)));
        }
        return out;
    }

    void run()
    {
        h.scheduler->runAll();
    }

    RuntimeHarness h;
    uint32_t origin = 0;
    support::Symbol echo;
    support::Symbol value;
};

} // namespace

TEST_F(DebugActorTest, StateNamesAreStable)
{
    EXPECT_EQ(toString(DebuggingState::Paused), "paused");
    EXPECT_EQ(toString(PausedState::StepReturn), "step-return");
    EXPECT_EQ(toString(BreakpointSide::Receiver), "receiver");
}

TEST_F(DebugActorTest, AttachMovesInitialToRunning)
{
    auto a = rt().debugActor(rt().spawn("a"));
    EXPECT_EQ(a->debuggingState(), DebuggingState::Initial);
    a->attach();
    EXPECT_TRUE(a->isStarted());
    EXPECT_EQ(a->debuggingState(), DebuggingState::Running);
    a->attach();
    EXPECT_EQ(session().countEvents(DebugEventKind::ActorAttached, a->id()), 1u);
}

TEST_F(DebugActorTest, ReceiverBreakpointHoldsMessageUntilStepOver)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(10), BreakpointSide::Receiver);

    auto p = send(a, 1, at(10));
    EXPECT_TRUE(a->isPausedByBreakpoint());
    EXPECT_EQ(a->inboxSize(), 1u);
    run();
    EXPECT_TRUE(echoed().empty());
    EXPECT_FALSE(p->isResolved());

    a->stepOver();
    EXPECT_TRUE(a->isInStepOver());
    EXPECT_EQ(a->inboxSize(), 0u);
    run();

    EXPECT_EQ(echoed(), (std::vector<int64_t>{1}));
    EXPECT_EQ(asInt(p->value()), 1);
    EXPECT_EQ(a->debuggingState(), DebuggingState::Running);
    EXPECT_EQ(a->pausedState(), PausedState::Initial);
}

TEST_F(DebugActorTest, StepOverStaysPausedWhileInboxHoldsMessages)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(10), BreakpointSide::Receiver);
    send(a, 1, at(10));
    send(a, 2, at(11));
    EXPECT_EQ(a->inboxSize(), 2u);

    a->stepOver();
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1}));
    EXPECT_TRUE(a->isPaused());
    EXPECT_EQ(a->pausedState(), PausedState::Initial);
    EXPECT_EQ(a->inboxSize(), 1u);

    EXPECT_TRUE(a->resume());
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1, 2}));
}

TEST_F(DebugActorTest, MessagesBufferedBeforeAttachWaitForAStep)
{
    auto a = rt().debugActor(rt().spawn("a"));
    auto p1 = send(a, 1);
    EXPECT_EQ(a->inboxSize(), 1u);
    EXPECT_EQ(a->debuggingState(), DebuggingState::Initial);
    run();
    EXPECT_TRUE(echoed().empty());

    a->attach();
    auto p2 = send(a, 2);
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{2}));
    EXPECT_EQ(a->inboxSize(), 1u);
    EXPECT_FALSE(p1->isResolved());

    a->stepInto();
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{2, 1}));
    EXPECT_TRUE(p1->isResolved());
    EXPECT_EQ(a->debuggingState(), DebuggingState::Running);
}

TEST_F(DebugActorTest, StepIntoReleasesBreakpointedMessageAndRuns)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(20), BreakpointSide::Receiver);
    send(a, 7, at(20));
    send(a, 8, at(21));
    EXPECT_EQ(a->inboxSize(), 2u);

    a->stepInto();
    EXPECT_TRUE(a->isInStepInto());
    run();

    EXPECT_EQ(echoed(), (std::vector<int64_t>{7}));
    EXPECT_EQ(a->debuggingState(), DebuggingState::Running);
    EXPECT_EQ(a->pausedState(), PausedState::Initial);
    EXPECT_EQ(a->inboxSize(), 1u);
}

TEST_F(DebugActorTest, SenderBreakpointDefersPauseToResolution)
{
    auto a = spawnAttached("a");
    auto b = spawnAttached("b");
    auto kick = rt().selector("kick");
    PromiseRef sent;
    PromiseRef callback;
    h.interpreter.on(kick,
                     [&](const Value &, const std::vector<Value> &, Actor &)
                     {
                         sent = rt().eventualSend(a, Nil{}, echo, {intValue(5)}, at(30));
                         callback = rt().whenResolved(sent, b, Nil{}, value);
                         return Value{Nil{}};
                     });
    b->addBreakpoint(at(30), BreakpointSide::Sender);

    rt().post(b, Nil{}, kick);
    run();

    ASSERT_TRUE(sent);
    EXPECT_TRUE(sent->haltOnResolution());
    EXPECT_EQ(asInt(sent->value()), 5);
    EXPECT_FALSE(a->isPaused());
    EXPECT_EQ(session().countEvents(DebugEventKind::FutureBreakpointInstalled, a->id()), 1u);

    EXPECT_TRUE(b->isPausedByBreakpoint());
    EXPECT_EQ(b->inboxSize(), 1u);
    EXPECT_EQ(h.interpreter.callCount(value), 0u);

    EXPECT_TRUE(b->resume());
    run();
    EXPECT_EQ(h.interpreter.callCount(value), 1u);
    EXPECT_EQ(asInt(callback->value()), 5);
    EXPECT_FALSE(b->isPaused());
}

TEST_F(DebugActorTest, PauseBuffersAndResumeDrainsInOrder)
{
    auto a = spawnAttached("a");
    a->pause();
    EXPECT_TRUE(a->isPaused());
    EXPECT_EQ(a->pausedState(), PausedState::Command);
    for (int i = 1; i <= 4; ++i)
        send(a, i);
    run();
    EXPECT_TRUE(echoed().empty());
    EXPECT_EQ(a->inboxSize(), 4u);

    EXPECT_TRUE(a->resume());
    EXPECT_EQ(a->inboxSize(), 0u);
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(session().countEvents(DebugEventKind::MessageReleased, a->id()), 4u);
}

TEST_F(DebugActorTest, ResumeWhenNotPausedDoesNothing)
{
    auto a = spawnAttached("a");
    EXPECT_FALSE(a->resume());
    EXPECT_EQ(session().countEvents(DebugEventKind::ActorResumed, a->id()), 0u);
}

TEST_F(DebugActorTest, ResumeStopsAtNextBreakpointedMessage)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(40), BreakpointSide::Receiver);
    a->pause();
    send(a, 1);
    send(a, 2, at(40));
    send(a, 3);

    ASSERT_TRUE(a->resume());
    EXPECT_TRUE(a->isPausedByBreakpoint());
    EXPECT_EQ(a->inboxSize(), 2u);
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1}));

    ASSERT_TRUE(a->resume());
    EXPECT_FALSE(a->isPaused());
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(session().countEvents(DebugEventKind::BreakpointHit, a->id()), 1u);
}

TEST_F(DebugActorTest, StepReturnArmsFutureBreakpoints)
{
    auto a = spawnAttached("a");
    a->pause();
    auto held = send(a, 1);
    a->stepReturn();
    EXPECT_TRUE(a->isInStepReturn());
    EXPECT_TRUE(held->haltOnResolution());

    auto later = send(a, 2);
    EXPECT_TRUE(later->haltOnResolution());
    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1, 2}));
    EXPECT_TRUE(a->isInStepReturn());
    EXPECT_EQ(session().countEvents(DebugEventKind::FutureBreakpointInstalled, a->id()), 2u);
}

TEST_F(DebugActorTest, ResolverHaltPausesResolvingActor)
{
    auto a = spawnAttached("a");
    auto settle = rt().selector("settle");
    PromiseRef halted;
    h.interpreter.on(settle,
                     [&](const Value &, const std::vector<Value> &, Actor &)
                     {
                         auto pair = rt().createPromisePair();
                         pair.promise->enableHaltOnResolver();
                         halted = pair.promise;
                         rt().resolve(pair.resolver, intValue(9));
                         return Value{Nil{}};
                     });

    rt().post(a, Nil{}, settle);
    run();

    ASSERT_TRUE(halted);
    EXPECT_EQ(asInt(halted->value()), 9);
    EXPECT_TRUE(a->isPausedByBreakpoint());
    auto events = session().eventsFor(a->id());
    ASSERT_FALSE(events.empty());
    bool sawHalt = false;
    for (const auto &e : events)
    {
        if (e.kind == DebugEventKind::ResolverHalt)
        {
            sawHalt = true;
            EXPECT_EQ(e.promiseId, halted->id());
        }
    }
    EXPECT_TRUE(sawHalt);
}

TEST_F(DebugActorTest, HaltAtBreakpointIgnoredBeforeAttach)
{
    auto a = rt().debugActor(rt().spawn("a"));
    a->haltAtBreakpoint();
    EXPECT_EQ(a->debuggingState(), DebuggingState::Initial);
}

TEST_F(DebugActorTest, DisabledOrRemovedBreakpointsDoNotMatch)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(50), BreakpointSide::Receiver);
    EXPECT_TRUE(a->isBreakpointed(at(50), BreakpointSide::Receiver));
    EXPECT_FALSE(a->isBreakpointed(at(50, 2), BreakpointSide::Receiver));
    EXPECT_FALSE(a->isBreakpointed(at(50), BreakpointSide::Sender));

    ASSERT_TRUE(session().breakpoints().setEnabled(at(50), BreakpointSide::Receiver, false));
    send(a, 1, at(50));
    EXPECT_FALSE(a->isPaused());

    ASSERT_TRUE(session().breakpoints().setEnabled(at(50), BreakpointSide::Receiver, true));
    EXPECT_TRUE(a->removeBreakpoint(at(50), BreakpointSide::Receiver));
    EXPECT_FALSE(a->removeBreakpoint(at(50), BreakpointSide::Receiver));
    send(a, 2, at(50));
    EXPECT_FALSE(a->isPaused());

    run();
    EXPECT_EQ(echoed(), (std::vector<int64_t>{1, 2}));
}

TEST_F(DebugActorTest, TearDownDropsBufferedMessages)
{
    auto a = spawnAttached("a");
    a->pause();
    send(a, 1);
    send(a, 2);
    a->tearDown();
    EXPECT_EQ(a->inboxSize(), 0u);
    EXPECT_THROW(send(a, 3), ActorTornDownError);
    run();
    EXPECT_TRUE(echoed().empty());
}

TEST_F(DebugActorTest, EventLogRecordsDeliveryPath)
{
    auto a = spawnAttached("a");
    a->addBreakpoint(at(60), BreakpointSide::Receiver);
    auto p = send(a, 1, at(60));
    a->resume();

    std::vector<DebugEventKind> kinds;
    for (const auto &e : session().eventsFor(a->id()))
        kinds.push_back(e.kind);
    const std::vector<DebugEventKind> expected{DebugEventKind::ActorAttached,
                                               DebugEventKind::BreakpointHit,
                                               DebugEventKind::MessageBuffered,
                                               DebugEventKind::ActorPaused,
                                               DebugEventKind::ActorResumed,
                                               DebugEventKind::MessageReleased,
                                               DebugEventKind::MessageAddedToMailbox};
    EXPECT_EQ(kinds, expected);
    for (const auto &e : session().eventsFor(a->id()))
    {
        if (e.kind == DebugEventKind::BreakpointHit)
            EXPECT_EQ(e.location, at(60));
    }
    run();
    EXPECT_TRUE(p->isResolved());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
