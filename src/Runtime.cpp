//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/Runtime.cpp
// Purpose: Implement the runtime façade: configuration, actor spawning,
//          eventual sends and promise helpers.
// Key invariants:
//   - Sends made from inside a turn record the executing actor as sender and
//     as owner of the result promise.
//   - The scheduler is stopped before the session and trace sink it may still
//     reference are destroyed.
//   - Actors may outlive the runtime: they are torn down first and reach the
//     session only through a weak handle.
// Ownership/Lifetime: See include/strand/Runtime.hpp.
// Links: include/strand/Runtime.hpp
//
//===----------------------------------------------------------------------===//

#include "strand/Runtime.hpp"

#include "actors/Actor.hpp"
#include "actors/EventualMessage.hpp"
#include "actors/Interpreter.hpp"
#include "actors/Scheduler.hpp"
#include "actors/ThreadPool.hpp"
#include "debug/DebugActor.hpp"
#include "debug/DebugSession.hpp"
#include "support/source_manager.hpp"
#include "support/string_interner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace strand
{

using actors::Actor;
using actors::ActorRef;
using actors::EventualMessage;
using actors::PromiseRef;
using actors::Value;

namespace
{

std::string lowered(const char *raw)
{
    std::string v{raw};
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

bool parseUnsigned(const char *raw, unsigned long &out)
{
    if (!raw || *raw == '\0')
        return false;
    char *end = nullptr;
    unsigned long n = std::strtoul(raw, &end, 10);
    if (!end || *end != '\0')
        return false;
    out = n;
    return true;
}

} // namespace

/// @brief Layer environment overrides over @p base.
///
/// @details Mirrors the interpreter's handling of its own switches: values are
///          compared case-insensitively, booleans accept 1/true/on and
///          0/false/off, and anything else leaves the programmatic value in
///          place so a typo never silently changes behaviour.
RuntimeConfig RuntimeConfig::fromEnvironment(RuntimeConfig base)
{
    unsigned long n = 0;
    if (parseUnsigned(std::getenv("STRAND_WORKERS"), n))
        base.workers = static_cast<unsigned>(n);
    if (parseUnsigned(std::getenv("STRAND_TURNS_PER_ACTIVATION"), n) && n > 0)
        base.turnsPerActivation = static_cast<uint32_t>(n);
    if (parseUnsigned(std::getenv("STRAND_DEBUG_EVENTS"), n))
        base.debugEventCapacity = static_cast<size_t>(n);
    if (const char *env = std::getenv("STRAND_DEBUG"))
    {
        const std::string v = lowered(env);
        if (v == "0" || v == "false" || v == "off")
            base.debugging = false;
        else if (v == "1" || v == "true" || v == "on")
            base.debugging = true;
    }
    if (const char *env = std::getenv("STRAND_TRACE"))
    {
        if (auto mode = actors::TraceConfig::parseMode(env))
            base.trace.mode = *mode;
    }
    return base;
}

struct Runtime::Impl
{
    Impl(actors::Interpreter &interp, RuntimeConfig cfg, std::unique_ptr<actors::Scheduler> sched)
        : config(cfg), trace(traceConfigFor(cfg.trace)), interpreter(interp), scheduler(std::move(sched))
    {
        if (!scheduler)
            scheduler = std::make_unique<actors::ThreadPool>(config.workers);
        if (config.debugging)
            session = std::make_shared<debug::DebugSession>(&sources, &trace, config.debugEventCapacity);
    }

    actors::TraceConfig traceConfigFor(actors::TraceConfig t)
    {
        if (!t.sm)
            t.sm = &sources;
        if (!t.selectors)
            t.selectors = &selectors;
        return t;
    }

    actors::ActorContext context()
    {
        actors::ActorContext ctx;
        ctx.scheduler = scheduler.get();
        ctx.interpreter = &interpreter;
        ctx.trace = config.trace.enabled() ? &trace : nullptr;
        ctx.haltListener = session.get();
        ctx.turnsPerActivation = config.turnsPerActivation;
        return ctx;
    }

    void tearDownActors()
    {
        std::vector<std::weak_ptr<Actor>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mu);
            stopped = true;
            snapshot.swap(actors);
        }
        for (const auto &weak : snapshot)
        {
            if (auto actor = weak.lock())
                actor->tearDown();
        }
    }

    /// Track @p actor, forgetting actors nobody holds any more.
    void adopt(const ActorRef &actor)
    {
        std::lock_guard<std::mutex> lock(mu);
        if (stopped)
            throw std::logic_error("Runtime::spawn after shutdown");
        std::erase_if(actors, [](const std::weak_ptr<Actor> &w) { return w.expired(); });
        actors.push_back(actor);
    }

    size_t liveActors()
    {
        std::lock_guard<std::mutex> lock(mu);
        return static_cast<size_t>(
            std::count_if(actors.begin(), actors.end(), [](const std::weak_ptr<Actor> &w) { return !w.expired(); }));
    }

    RuntimeConfig config;
    support::StringInterner selectors;
    support::SourceManager sources;
    actors::TraceSink trace;
    std::shared_ptr<debug::DebugSession> session;
    actors::Interpreter &interpreter;

    std::mutex mu;
    std::vector<std::weak_ptr<Actor>> actors;
    bool stopped = false;

    /// Declared last so workers are joined before anything they use goes away.
    std::unique_ptr<actors::Scheduler> scheduler;
};

Runtime::Runtime(actors::Interpreter &interpreter, RuntimeConfig config)
    : Runtime(interpreter, std::move(config), nullptr)
{
}

Runtime::Runtime(actors::Interpreter &interpreter,
                 RuntimeConfig config,
                 std::unique_ptr<actors::Scheduler> scheduler)
    : impl_(std::make_unique<Impl>(interpreter, std::move(config), std::move(scheduler)))
{
}

Runtime::~Runtime()
{
    impl_->tearDownActors();
    impl_->scheduler->shutdown();
}

const RuntimeConfig &Runtime::config() const noexcept
{
    return impl_->config;
}

support::Symbol Runtime::selector(std::string_view name)
{
    return impl_->selectors.intern(name);
}

std::string_view Runtime::selectorName(support::Symbol sym) const
{
    return impl_->selectors.lookup(sym);
}

support::SourceManager &Runtime::sources() noexcept
{
    return impl_->sources;
}

debug::DebugSession *Runtime::debugSession() noexcept
{
    return impl_->session.get();
}

ActorRef Runtime::spawn(std::string name)
{
    ActorRef actor;
    if (impl_->session)
        actor = debug::DebugActor::create(impl_->context(), std::move(name), impl_->session);
    else
        actor = Actor::create(impl_->context(), std::move(name));
    impl_->adopt(actor);
    return actor;
}

size_t Runtime::liveActors() const
{
    return impl_->liveActors();
}

std::shared_ptr<debug::DebugActor> Runtime::debugActor(const ActorRef &actor) const
{
    return std::dynamic_pointer_cast<debug::DebugActor>(actor);
}

PromiseRef Runtime::eventualSend(const ActorRef &target,
                                 Value receiver,
                                 support::Symbol selector,
                                 std::vector<Value> args,
                                 support::SourceLocation callSite)
{
    Actor *sender = Actor::current();
    auto pair = actors::createPair(sender);
    auto msg = EventualMessage::direct(
        target, sender, std::move(receiver), selector, std::move(args), pair.resolver, callSite);
    target->send(std::move(msg));
    return pair.promise;
}

PromiseRef Runtime::eventualSend(const actors::FarReference &ref,
                                 support::Symbol selector,
                                 std::vector<Value> args,
                                 support::SourceLocation callSite)
{
    if (!ref.owner)
        throw std::invalid_argument("Runtime::eventualSend: far reference without owner");
    return eventualSend(ref.owner, ref.object, selector, std::move(args), callSite);
}

void Runtime::post(const ActorRef &target,
                   Value receiver,
                   support::Symbol selector,
                   std::vector<Value> args,
                   support::SourceLocation callSite)
{
    auto msg = EventualMessage::direct(
        target, Actor::current(), std::move(receiver), selector, std::move(args), nullptr, callSite);
    target->send(std::move(msg));
}

PromiseRef Runtime::sendToPromise(const PromiseRef &promise,
                                  support::Symbol selector,
                                  std::vector<Value> args,
                                  support::SourceLocation callSite)
{
    if (!promise)
        throw std::invalid_argument("Runtime::sendToPromise: null promise");
    Actor *sender = Actor::current();
    auto pair = actors::createPair(sender);
    auto msg = EventualMessage::promiseSend(sender, selector, std::move(args), pair.resolver, callSite);
    actors::addDependent(*promise, std::move(msg));
    return pair.promise;
}

namespace
{

PromiseRef registerCallback(const PromiseRef &promise,
                            const ActorRef &registrar,
                            Value block,
                            support::Symbol selector,
                            actors::CallbackKind kind,
                            support::SourceLocation callSite)
{
    if (!promise)
        throw std::invalid_argument("Runtime: callback on null promise");
    auto pair = actors::createPair(registrar.get());
    auto msg = EventualMessage::callback(registrar, std::move(block), selector, kind, pair.resolver, callSite);
    actors::addDependent(*promise, std::move(msg));
    return pair.promise;
}

} // namespace

PromiseRef Runtime::whenResolved(const PromiseRef &promise,
                                 const ActorRef &registrar,
                                 Value block,
                                 support::Symbol selector,
                                 support::SourceLocation callSite)
{
    return registerCallback(
        promise, registrar, std::move(block), selector, actors::CallbackKind::WhenResolved, callSite);
}

PromiseRef Runtime::onError(const PromiseRef &promise,
                            const ActorRef &registrar,
                            Value block,
                            support::Symbol selector,
                            support::SourceLocation callSite)
{
    return registerCallback(promise, registrar, std::move(block), selector, actors::CallbackKind::OnError, callSite);
}

actors::PromisePair Runtime::createPromisePair()
{
    return actors::createPair(Actor::current());
}

void Runtime::resolve(const actors::ResolverRef &resolver, Value value, actors::Outcome outcome)
{
    if (!resolver)
        throw std::invalid_argument("Runtime::resolve: null resolver");
    actors::resolve(*resolver, std::move(value), outcome, false, false, impl_->session.get());
}

void Runtime::awaitQuiescence()
{
    impl_->scheduler->waitIdle();
}

void Runtime::shutdown()
{
    awaitQuiescence();
    impl_->tearDownActors();
    impl_->scheduler->shutdown();
}

} // namespace strand
