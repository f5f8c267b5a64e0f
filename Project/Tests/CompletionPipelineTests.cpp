// File: Tests/CompletionPipelineTests.cpp
// Purpose: Completion handling shared by both execution modes: earnings transfer, one-shot
//          settlement, idempotent teardown and the user notices per termination reason.
// Key invariants: Teardown happens once; a process settles once; earnings reach a parent only
//                 on natural completion while the parent still runs.

#include <gtest/gtest.h>

#include "TestSupport.h"

using namespace WorkerHostTest;

namespace {

    struct PipelineFixture {
        std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
        ProcessEngine engine;
        ServerPtr home = MakeServer("home", 16.0);

        explicit PipelineFixture(HostSettingsData settings = FastSettings())
            : engine(settings, notifier) {
            engine.AddServer(home);
            AddScript(*home, "parent.script", "sleep(1000000)\n");
            AddScript(*home, "child.script", "sleep(100)\n");
        }

        std::shared_ptr<WorkerScript> StartParent() {
            ProcessId pid = Launch(engine, *home, "parent.script");
            engine.Tick(1);
            return engine.GetProcess(pid);
        }

        std::shared_ptr<WorkerScript> StartChild(WorkerScript& parent) {
            ProcessId pid = engine.StartNestedProcess(parent, *home, Value("child.script"), Value::MakeArray());
            return engine.GetProcess(pid);
        }
    };

} // namespace

TEST(CompletionPipeline, FinishedChildTransfersEarningsToRunningParent) {
    PipelineFixture fx;
    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);
    auto child = fx.StartChild(*parent);
    ASSERT_NE(child, nullptr);

    child->ScriptRef().onlineMoneyMade = 50.0;
    child->ScriptRef().onlineExpGained = 7.5;
    fx.engine.Tick(200);

    EXPECT_EQ(child->Outcome(), ProcessOutcome::Finished);
    EXPECT_DOUBLE_EQ(parent->ScriptRef().onlineMoneyMade, 50.0);
    EXPECT_DOUBLE_EQ(parent->ScriptRef().onlineExpGained, 7.5);
}

TEST(CompletionPipeline, NoTransferWhenParentIsGone) {
    PipelineFixture fx;
    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);
    auto child = fx.StartChild(*parent);
    ASSERT_NE(child, nullptr);
    child->ScriptRef().onlineMoneyMade = 50.0;

    fx.engine.KillProcess(parent->Pid());
    fx.engine.Tick(200);

    EXPECT_EQ(child->Outcome(), ProcessOutcome::Finished);
    EXPECT_DOUBLE_EQ(parent->ScriptRef().onlineMoneyMade, 0.0);
}

TEST(CompletionPipeline, NoTransferToAProcessThatReusedTheParentPid) {
    HostSettingsData settings = FastSettings();
    settings.maxPid = 2;
    PipelineFixture fx(settings);
    AddScript(*fx.home, "other.script", "sleep(1000000)\n");

    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);
    auto child = fx.StartChild(*parent);
    ASSERT_NE(child, nullptr);
    child->ScriptRef().onlineMoneyMade = 50.0;

    const ProcessId parentPid = parent->Pid();
    fx.engine.KillProcess(parentPid);
    fx.engine.Tick(1);
    auto other = fx.engine.GetProcess(Launch(fx.engine, *fx.home, "other.script"));
    ASSERT_NE(other, nullptr);
    ASSERT_EQ(other->Pid(), parentPid);

    fx.engine.Tick(200);
    EXPECT_EQ(child->Outcome(), ProcessOutcome::Finished);
    EXPECT_DOUBLE_EQ(other->ScriptRef().onlineMoneyMade, 0.0);
    EXPECT_DOUBLE_EQ(parent->ScriptRef().onlineMoneyMade, 0.0);
}

TEST(CompletionPipeline, NoTransferWhenChildIsKilled) {
    PipelineFixture fx;
    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);
    auto child = fx.StartChild(*parent);
    ASSERT_NE(child, nullptr);
    child->ScriptRef().onlineMoneyMade = 50.0;

    fx.engine.KillProcess(child->Pid());
    fx.engine.Tick(200);

    EXPECT_EQ(child->Outcome(), ProcessOutcome::Stopped);
    EXPECT_DOUBLE_EQ(parent->ScriptRef().onlineMoneyMade, 0.0);
}

TEST(CompletionPipeline, TeardownRunsOnce) {
    PipelineFixture fx;
    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);
    int changes = 0;
    fx.engine.AddProcessListListener([&]() { ++changes; });

    EXPECT_TRUE(fx.engine.Teardown(*parent));
    EXPECT_FALSE(fx.engine.Teardown(*parent));
    EXPECT_EQ(changes, 1);
    EXPECT_TRUE(parent->IsTornDown());
    EXPECT_FALSE(parent->IsRunning());
    EXPECT_TRUE(parent->Env().stopFlag);
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);

    fx.engine.Tick(5);
    EXPECT_EQ(parent->Outcome(), ProcessOutcome::Stopped);
}

TEST(CompletionPipeline, SecondSettlementIsIgnored) {
    PipelineFixture fx;
    auto parent = fx.StartParent();
    ASSERT_NE(parent, nullptr);

    ProcessCompletion crash;
    crash.outcome = ProcessOutcome::Crashed;
    crash.reason = TerminationReason{ RuntimeErrorMessage{ Error::MakeRuntimeErrorMessage("home", "parent.script", "first") } };
    fx.engine.OnProcessSettled(parent, crash);

    crash.reason = TerminationReason{ RuntimeErrorMessage{ Error::MakeRuntimeErrorMessage("home", "parent.script", "second") } };
    fx.engine.OnProcessSettled(parent, crash);

    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_EQ(fx.notifier->notices[0], "RUNTIME ERROR\nparent.script@home\n\nfirst");
    EXPECT_EQ(parent->Outcome(), ProcessOutcome::Crashed);
    EXPECT_EQ(fx.engine.GetProcess(parent->Pid()), nullptr);
}

TEST(CompletionPipeline, NoticePerTerminationReason) {
    PipelineFixture fx;

    auto settle = [&](TerminationReason reason) {
        auto ws = fx.StartParent();
        ProcessCompletion completion;
        completion.outcome = ProcessOutcome::Crashed;
        completion.reason = std::move(reason);
        fx.engine.OnProcessSettled(ws, completion);
        EXPECT_FALSE(ws->IsRunning());
        EXPECT_EQ(fx.engine.GetProcess(ws->Pid()), nullptr);
        return ws;
    };

    settle(NativeFault{ "bad_alloc" });
    EXPECT_TRUE(fx.notifier->Noticed("Script runtime unknown error. This is a bug please contact game developer"));

    settle(Unrecognized{ "error object is a table value" });
    EXPECT_TRUE(fx.notifier->Noticed("An unknown script died for an unknown reason. This is a bug please contact game dev"));

    auto killed = settle(AlreadyTerminated{});
    EXPECT_EQ(fx.notifier->notices.size(), 2u);
    EXPECT_TRUE(HasLog(killed->ScriptRef(), "Script killed"));

    auto malformed = settle(RuntimeErrorMessage{ "not|a|runtime|error|message" });
    EXPECT_EQ(fx.notifier->notices.size(), 2u);
    EXPECT_FALSE(HasLog(malformed->ScriptRef(), "Script crashed with runtime error"));

    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}

TEST(CompletionPipeline, FinishAfterExitDoesNotTearDownTwice) {
    PipelineFixture fx;
    AddScript(*fx.home, "exiting.script", "exit()\n");
    auto record = LaunchRecord(fx.engine, *fx.home, "exiting.script");
    fx.engine.RunUntilIdle(1000);

    EXPECT_TRUE(HasLog(*record, "Script killed"));
    EXPECT_FALSE(HasLog(*record, "Script finished running"));
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}
