//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/DebugScriptTests.cpp
// Purpose: Parse debugger command scripts and apply them to a live session.
// Key invariants: Malformed lines are reported and skipped; remaining
//                 commands still run in order.
// Ownership/Lifetime: Standalone executable.
// Links: src/debug/DebugScript.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/common/ActorFixture.hpp"

#include "debug/DebugActor.hpp"
#include "debug/DebugScript.hpp"
#include "debug/DebugSession.hpp"
#include "strand/Runtime.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace strand;
using namespace strand::debug;
using strand::tests::RuntimeHarness;

TEST(DebugScriptParse, ActorCommands)
{
    auto attachAll = DebugScript::parseLine("attach");
    ASSERT_TRUE(attachAll);
    EXPECT_EQ(attachAll.value().kind, DebugCommandKind::Attach);
    EXPECT_TRUE(attachAll.value().actor.empty());

    auto step = DebugScript::parseLine("  step-over   worker \r");
    ASSERT_TRUE(step);
    EXPECT_EQ(step.value().kind, DebugCommandKind::StepOver);
    EXPECT_EQ(step.value().actor, "worker");

    EXPECT_EQ(DebugScript::parseLine("step-return w").value().kind, DebugCommandKind::StepReturn);
    EXPECT_EQ(DebugScript::parseLine("resume w").value().kind, DebugCommandKind::Resume);
}

TEST(DebugScriptParse, BreakpointLocationsSplitFromTheRight)
{
    auto cmd = DebugScript::parseLine("break sender * file:///src/app.st:12:5:340");
    ASSERT_TRUE(cmd);
    EXPECT_EQ(cmd.value().kind, DebugCommandKind::Break);
    EXPECT_EQ(cmd.value().side, BreakpointSide::Sender);
    EXPECT_TRUE(cmd.value().actor.empty());
    EXPECT_EQ(cmd.value().uri, "file:///src/app.st");
    EXPECT_EQ(cmd.value().line, 12u);
    EXPECT_EQ(cmd.value().column, 5u);
    EXPECT_EQ(cmd.value().offset, 340u);

    auto clear = DebugScript::parseLine("clear receiver bank main.st:1:1:0");
    ASSERT_TRUE(clear);
    EXPECT_EQ(clear.value().kind, DebugCommandKind::Clear);
    EXPECT_EQ(clear.value().actor, "bank");
}

TEST(DebugScriptParse, MalformedLinesAreErrors)
{
    const support::SourceLocation where{3, 9, 1, 0};
    for (const char *bad : {"",
                            "jump w",
                            "pause",
                            "pause a b",
                            "attach a b",
                            "break middle * a.st:1:1:0",
                            "break receiver * a.st:1:1",
                            "break receiver * :1:1:0",
                            "break receiver * a.st:x:1:0",
                            "clear receiver *"})
    {
        auto parsed = DebugScript::parseLine(bad, where);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error().severity, support::Severity::Error);
        EXPECT_EQ(parsed.error().loc, where);
    }
}

TEST(DebugScriptLoad, SkipsCommentsAndReportsBadLines)
{
    support::SourceManager sm;
    const uint32_t origin = sm.addOrigin("session.dbg");
    std::istringstream in("# prepare\n"
                          "attach\n"
                          "\n"
                          "frobnicate\n"
                          "break receiver * app.st:4:2:77\n"
                          "   # indented comment\n"
                          "resume worker\n");
    support::DiagnosticEngine de;
    DebugScript script;
    EXPECT_EQ(script.load(in, de, origin), 3u);
    EXPECT_EQ(script.size(), 3u);
    ASSERT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.diagnostics()[0].loc.line, 4u);

    std::ostringstream printed;
    de.printAll(printed, &sm);
    EXPECT_NE(printed.str().find("session.dbg:4:1"), std::string::npos);

    EXPECT_EQ(script.next()->kind, DebugCommandKind::Attach);
    EXPECT_EQ(script.next()->kind, DebugCommandKind::Break);
    EXPECT_EQ(script.next()->kind, DebugCommandKind::Resume);
    EXPECT_FALSE(script.next().has_value());
    EXPECT_TRUE(script.empty());
}

TEST(DebugScriptLoad, MissingFileIsReported)
{
    support::DiagnosticEngine de;
    DebugScript script("/nonexistent/strand/none.dbg", de);
    EXPECT_TRUE(script.empty());
    EXPECT_EQ(de.errorCount(), 1u);
}

namespace
{

class DebugScriptRunTest : public ::testing::Test
{
  protected:
    DebugScriptRunTest() : h(RuntimeHarness::debugging())
    {
        worker = h.runtime->debugActor(h.runtime->spawn("worker"));
        other = h.runtime->debugActor(h.runtime->spawn("other"));
    }

    DebugSession &session()
    {
        return *h.runtime->debugSession();
    }

    size_t run(const std::string &text)
    {
        std::istringstream in(text);
        DebugScript script;
        script.load(in, de);
        return script.runAll(session(), de);
    }

    RuntimeHarness h;
    std::shared_ptr<DebugActor> worker;
    std::shared_ptr<DebugActor> other;
    support::DiagnosticEngine de;
};

} // namespace

TEST_F(DebugScriptRunTest, CommandsDriveActors)
{
    EXPECT_EQ(run("attach worker\npause worker\nstep-into worker\n"), 3u);
    EXPECT_TRUE(worker->isStarted());
    EXPECT_TRUE(worker->isInStepInto());
    EXPECT_FALSE(other->isStarted());

    EXPECT_EQ(run("attach\nresume worker\n"), 2u);
    EXPECT_TRUE(other->isStarted());
    EXPECT_FALSE(worker->isPaused());
    EXPECT_EQ(de.errorCount(), 0u);
}

TEST_F(DebugScriptRunTest, BreakpointsInstallPerActorOrSessionWide)
{
    EXPECT_EQ(run("break receiver worker app.st:3:1:20\nbreak sender * app.st:9:2:90\n"), 2u);

    const uint32_t origin = h.runtime->sources().findOrigin("app.st").value();
    const support::SourceLocation receiverLoc{origin, 3, 1, 20};
    const support::SourceLocation senderLoc{origin, 9, 2, 90};
    EXPECT_TRUE(worker->isBreakpointed(receiverLoc, BreakpointSide::Receiver));
    EXPECT_FALSE(other->isBreakpointed(receiverLoc, BreakpointSide::Receiver));
    EXPECT_TRUE(worker->hasSenderBreakpoint(senderLoc));
    EXPECT_TRUE(other->hasSenderBreakpoint(senderLoc));

    EXPECT_EQ(run("clear sender * app.st:9:2:90\n"), 1u);
    EXPECT_FALSE(worker->hasSenderBreakpoint(senderLoc));
    EXPECT_FALSE(other->hasSenderBreakpoint(senderLoc));
}

TEST_F(DebugScriptRunTest, FailuresAreReportedAndSkipped)
{
    EXPECT_EQ(run("pause ghost\nattach worker\nresume worker\nclear receiver worker app.st:1:1:0\n"), 1u);
    EXPECT_TRUE(worker->isStarted());
    ASSERT_EQ(de.diagnostics().size(), 3u);
    EXPECT_EQ(de.diagnostics()[0].severity, support::Severity::Error);
    EXPECT_NE(de.diagnostics()[0].message.find("ghost"), std::string::npos);
    EXPECT_EQ(de.diagnostics()[1].severity, support::Severity::Warning);
    EXPECT_EQ(de.diagnostics()[2].severity, support::Severity::Warning);
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 2u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
