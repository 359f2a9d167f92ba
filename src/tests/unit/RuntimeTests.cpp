//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/RuntimeTests.cpp
// Purpose: Exercise the Runtime façade: pipelining, callbacks, tracing and
//          lifecycle.
// Key invariants: Pipelined sends execute where their resolved value lives;
//                 errors pass through sends and callbacks that do not react
//                 to them.
// Ownership/Lifetime: Standalone executable.
// Links: include/strand/Runtime.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/common/ActorFixture.hpp"

#include "actors/Actor.hpp"
#include "actors/Errors.hpp"
#include "debug/DebugActor.hpp"
#include "strand/Runtime.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace strand;
using namespace strand::actors;
using strand::tests::asInt;
using strand::tests::intValue;
using strand::tests::RuntimeHarness;
using strand::tests::TestObject;

namespace
{

class RuntimeTest : public ::testing::Test
{
  protected:
    RuntimeTest()
    {
        echo = rt().selector("echo:");
        fail = rt().selector("fail");
        value = rt().selector("value:");
        h.interpreter.on(echo, [](const Value &, const std::vector<Value> &args, Actor &) { return args.at(0); });
        h.interpreter.on(fail,
                         [](const Value &, const std::vector<Value> &, Actor &) -> Value
                         { throw RuntimeSignal(Value{std::string("boom")}, "boom"); });
        h.interpreter.on(value,
                         [](const Value &, const std::vector<Value> &args, Actor &)
                         {
                             if (const auto *n = std::get_if<int64_t>(&args.at(0)))
                                 return Value{*n + 100};
                             return Value{std::string("handled")};
                         });
    }

    Runtime &rt()
    {
        return *h.runtime;
    }

    void run()
    {
        h.scheduler->runAll();
    }

    RuntimeHarness h;
    support::Symbol echo;
    support::Symbol fail;
    support::Symbol value;
};

} // namespace

TEST_F(RuntimeTest, SelectorsAreInterned)
{
    EXPECT_EQ(rt().selector("echo:"), echo);
    EXPECT_EQ(rt().selectorName(echo), "echo:");
    EXPECT_TRUE(rt().selectorName(support::Symbol{}).empty());
}

TEST_F(RuntimeTest, EventualSendResolvesWithResult)
{
    auto a = rt().spawn("a");
    auto p = rt().eventualSend(a, Nil{}, echo, {intValue(3)});
    EXPECT_EQ(p->owner(), nullptr);
    run();
    EXPECT_EQ(p->resolution(), Resolution::Successful);
    EXPECT_EQ(asInt(p->value()), 3);
}

TEST_F(RuntimeTest, PostCreatesNoPromise)
{
    auto a = rt().spawn("a");
    rt().post(a, Nil{}, echo, {intValue(1)});
    run();
    EXPECT_EQ(h.interpreter.callCount(echo), 1u);
}

TEST_F(RuntimeTest, FarReferenceSendExecutesInOwner)
{
    auto home = rt().spawn("home");
    auto remote = rt().spawn("remote");
    auto obj = std::make_shared<TestObject>("account");
    auto lookup = rt().selector("lookup");
    auto balance = rt().selector("balance");
    h.interpreter.on(lookup,
                     [&](const Value &, const std::vector<Value> &, Actor &)
                     { return Value{FarReference{remote, obj}}; });
    h.interpreter.on(balance, [](const Value &, const std::vector<Value> &, Actor &) { return Value{int64_t{42}}; });

    auto ref = rt().eventualSend(home, Nil{}, lookup);
    auto answer = rt().sendToPromise(ref, balance);
    run();

    ASSERT_EQ(answer->resolution(), Resolution::Successful);
    EXPECT_EQ(asInt(answer->value()), 42);
    bool seen = false;
    for (const auto &call : h.interpreter.calls())
    {
        if (call.selector != balance)
            continue;
        seen = true;
        EXPECT_EQ(call.actorId, remote->id());
        EXPECT_EQ(std::get<ObjectRef>(call.receiver), obj);
    }
    EXPECT_TRUE(seen);
}

TEST_F(RuntimeTest, FarReferenceOverloadTargetsOwner)
{
    auto remote = rt().spawn("remote");
    auto obj = std::make_shared<TestObject>("counter");
    auto p = rt().eventualSend(FarReference{remote, obj}, echo, {intValue(5)});
    run();
    EXPECT_EQ(asInt(p->value()), 5);
    ASSERT_EQ(h.interpreter.calls().size(), 1u);
    EXPECT_EQ(h.interpreter.calls()[0].actorId, remote->id());
    EXPECT_THROW(rt().eventualSend(FarReference{nullptr, obj}, echo), std::invalid_argument);
}

TEST_F(RuntimeTest, LocalValueSendExecutesInPromiseOwner)
{
    auto client = rt().spawn("client");
    auto server = rt().spawn("server");
    auto start = rt().selector("start");
    auto twice = rt().selector("twice");
    PromiseRef computed;
    PromiseRef doubled;
    h.interpreter.on(start,
                     [&](const Value &, const std::vector<Value> &, Actor &)
                     {
                         computed = rt().eventualSend(server, Nil{}, echo, {intValue(21)});
                         doubled = rt().sendToPromise(computed, twice);
                         return Value{Nil{}};
                     });
    h.interpreter.on(twice,
                     [](const Value &receiver, const std::vector<Value> &, Actor &)
                     { return Value{std::get<int64_t>(receiver) * 2}; });

    rt().post(client, Nil{}, start);
    run();

    ASSERT_TRUE(computed);
    EXPECT_EQ(computed->owner(), client.get());
    ASSERT_EQ(doubled->resolution(), Resolution::Successful);
    EXPECT_EQ(asInt(doubled->value()), 42);
    for (const auto &call : h.interpreter.calls())
    {
        if (call.selector == twice)
            EXPECT_EQ(call.actorId, client->id());
    }
}

TEST_F(RuntimeTest, ErrorsPassThroughPipelinedSends)
{
    auto client = rt().spawn("client");
    auto server = rt().spawn("server");
    auto start = rt().selector("start");
    PromiseRef failed;
    PromiseRef chainedSend;
    h.interpreter.on(start,
                     [&](const Value &, const std::vector<Value> &, Actor &)
                     {
                         failed = rt().eventualSend(server, Nil{}, fail);
                         chainedSend = rt().sendToPromise(failed, echo, {intValue(1)});
                         return Value{Nil{}};
                     });

    rt().post(client, Nil{}, start);
    run();

    ASSERT_EQ(chainedSend->resolution(), Resolution::Erroneous);
    EXPECT_EQ(std::get<std::string>(chainedSend->value()), "boom");
    EXPECT_EQ(h.interpreter.callCount(echo), 0u);
}

TEST_F(RuntimeTest, CallbacksReactToTheirOutcomeOnly)
{
    auto a = rt().spawn("a");
    auto watcher = rt().spawn("watcher");
    auto block = std::make_shared<TestObject>("block");

    auto ok = rt().eventualSend(a, Nil{}, echo, {intValue(5)});
    auto onOk = rt().whenResolved(ok, watcher, block, value);
    auto skipped = rt().onError(ok, watcher, block, value);
    run();

    EXPECT_EQ(asInt(onOk->value()), 105);
    EXPECT_EQ(skipped->resolution(), Resolution::Successful);
    EXPECT_EQ(asInt(skipped->value()), 5);
    EXPECT_EQ(h.interpreter.callCount(value), 1u);

    auto bad = rt().eventualSend(a, Nil{}, fail);
    auto passed = rt().whenResolved(bad, watcher, block, value);
    auto handled = rt().onError(bad, watcher, block, value);
    run();

    EXPECT_EQ(passed->resolution(), Resolution::Erroneous);
    EXPECT_EQ(std::get<std::string>(passed->value()), "boom");
    EXPECT_EQ(handled->resolution(), Resolution::Successful);
    EXPECT_EQ(std::get<std::string>(handled->value()), "handled");

    for (const auto &call : h.interpreter.calls())
    {
        if (call.selector == value)
        {
            EXPECT_EQ(call.actorId, watcher->id());
            EXPECT_EQ(std::get<ObjectRef>(call.receiver), block);
        }
    }
}

TEST_F(RuntimeTest, CallbackOnResolvedPromiseRunsImmediately)
{
    auto watcher = rt().spawn("watcher");
    auto pair = rt().createPromisePair();
    rt().resolve(pair.resolver, intValue(1));
    auto r = rt().whenResolved(pair.promise, watcher, Nil{}, value);
    EXPECT_EQ(watcher->mailboxSize(), 1u);
    run();
    EXPECT_EQ(asInt(r->value()), 101);
}

TEST_F(RuntimeTest, NullArgumentsAreRejected)
{
    auto a = rt().spawn("a");
    EXPECT_THROW(rt().sendToPromise(nullptr, echo), std::invalid_argument);
    EXPECT_THROW(rt().whenResolved(nullptr, a, Nil{}, value), std::invalid_argument);
    EXPECT_THROW(rt().resolve(nullptr, Nil{}), std::invalid_argument);
}

TEST_F(RuntimeTest, ResolveTwiceThrows)
{
    auto pair = rt().createPromisePair();
    rt().resolve(pair.resolver, intValue(1));
    EXPECT_THROW(rt().resolve(pair.resolver, intValue(2)), AlreadyResolvedError);
    EXPECT_EQ(asInt(pair.promise->value()), 1);
}

TEST_F(RuntimeTest, SpawnIsPlainWithoutDebugging)
{
    auto a = rt().spawn("a");
    EXPECT_EQ(rt().debugSession(), nullptr);
    EXPECT_EQ(rt().debugActor(a), nullptr);
    EXPECT_EQ(a->name(), "a");
}

TEST_F(RuntimeTest, ShutdownTearsDownActors)
{
    auto a = rt().spawn("a");
    rt().shutdown();
    EXPECT_TRUE(a->isTornDown());
    EXPECT_THROW(rt().spawn("late"), std::logic_error);
    EXPECT_THROW(rt().eventualSend(a, Nil{}, echo, {intValue(1)}), ActorTornDownError);
}

TEST_F(RuntimeTest, ForgetsActorsNobodyHolds)
{
    auto a = rt().spawn("a");
    rt().spawn("discarded");
    EXPECT_EQ(rt().liveActors(), 1u);

    auto busy = rt().spawn("busy");
    auto p = rt().eventualSend(busy, Nil{}, echo, {intValue(2)});
    busy.reset();
    EXPECT_EQ(rt().liveActors(), 2u);
    run();
    EXPECT_EQ(asInt(p->value()), 2);
    EXPECT_EQ(rt().liveActors(), 1u);
}

TEST(RuntimeDebugging, SpawnCreatesAttachableDebugActors)
{
    RuntimeHarness h(RuntimeHarness::debugging());
    auto a = h.runtime->spawn("a");
    auto da = h.runtime->debugActor(a);
    ASSERT_NE(da, nullptr);
    ASSERT_NE(h.runtime->debugSession(), nullptr);
    EXPECT_EQ(h.runtime->debugSession()->findActor("a"), da);
    EXPECT_FALSE(da->isStarted());
}

TEST(RuntimeDebugging, ActorsOutliveTheirRuntime)
{
    auto pending = createPair();
    std::shared_ptr<debug::DebugActor> keep;
    {
        RuntimeHarness h(RuntimeHarness::debugging());
        auto echo = h.runtime->selector("echo:");
        keep = h.runtime->debugActor(h.runtime->spawn("a"));
        keep->attach();
        h.runtime->whenResolved(pending.promise, keep, Nil{}, echo);
        EXPECT_EQ(pending.promise->pendingDependents(), 1u);
    }
    EXPECT_TRUE(keep->isTornDown());
    EXPECT_EQ(keep->session(), nullptr);
    EXPECT_THROW(resolve(*pending.resolver, intValue(1), Outcome::Success), ActorTornDownError);
    keep->pause();
    keep.reset();
}

TEST(RuntimeDebugging, SessionLogUsesConfiguredCapacity)
{
    RuntimeConfig config = RuntimeHarness::debugging();
    config.debugEventCapacity = 2;
    RuntimeHarness h(config);
    auto a = h.runtime->debugActor(h.runtime->spawn("a"));
    a->attach();
    a->pause();
    a->resume();
    EXPECT_EQ(h.runtime->debugSession()->eventCapacity(), 2u);
    EXPECT_EQ(h.runtime->debugSession()->events().size(), 2u);
    EXPECT_EQ(h.runtime->debugSession()->droppedEvents(), 1u);
}

TEST(RuntimeTrace, TurnLinesNameActorAndSelector)
{
    std::ostringstream out;
    RuntimeConfig config;
    config.trace.mode = TraceConfig::Turns;
    config.trace.out = &out;
    RuntimeHarness h(config);
    auto echo = h.runtime->selector("echo:");
    h.interpreter.on(echo, [](const Value &, const std::vector<Value> &args, Actor &) { return args.at(0); });

    auto a = h.runtime->spawn("worker");
    h.runtime->eventualSend(a, Nil{}, echo, {intValue(1)});
    h.runtime->eventualSend(a, Nil{}, h.runtime->selector("nope"));
    h.scheduler->runAll();

    const std::string text = out.str();
    EXPECT_NE(text.find("[TURN] actor=" + std::to_string(a->id()) + ":worker"), std::string::npos);
    EXPECT_NE(text.find("sel=echo: outcome=ok value=1\n"), std::string::npos);
    EXPECT_NE(text.find("sel=nope outcome=error value=\""), std::string::npos);
}

TEST(RuntimePool, AwaitQuiescenceRethrowsEscapedFailure)
{
    tests::ScriptedInterpreter interp;
    RuntimeConfig config;
    config.workers = 2;
    Runtime rt(interp, config);
    auto crash = rt.selector("crash");
    auto echo = rt.selector("echo:");
    interp.on(crash,
              [](const Value &, const std::vector<Value> &, Actor &) -> Value
              { throw std::runtime_error("interpreter bug"); });
    interp.on(echo, [](const Value &, const std::vector<Value> &args, Actor &) { return args.at(0); });

    auto a = rt.spawn("a");
    auto lost = rt.eventualSend(a, Nil{}, crash);
    auto after = rt.eventualSend(a, Nil{}, echo, {intValue(8)});

    EXPECT_THROW(rt.awaitQuiescence(), std::runtime_error);
    EXPECT_NO_THROW(rt.awaitQuiescence());
    EXPECT_EQ(lost->resolution(), Resolution::Unresolved);
    EXPECT_EQ(asInt(after->value()), 8);
    EXPECT_FALSE(a->isExecuting());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
