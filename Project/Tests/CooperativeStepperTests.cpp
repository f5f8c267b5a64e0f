// File: Tests/CooperativeStepperTests.cpp
// Purpose: Legacy-mode execution: bounded steps, blocking host calls, import inlining and the
//          way compile, import and runtime failures are reported.
// Key invariants: A looping script never monopolizes the loop; runtime error lines point into
//                 the original source even after imports are inlined.
// Ownership/Lifetime: Each test owns its engine; records outlive their processes.

#include <gtest/gtest.h>

#include "TestSupport.h"

using namespace WorkerHostTest;

namespace {

    struct LegacyFixture {
        std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
        ProcessEngine engine;
        ServerPtr home = MakeServer("home", 32.0);

        explicit LegacyFixture(HostSettingsData settings = FastSettings())
            : engine(settings, notifier) {
            engine.AddServer(home);
        }
    };

} // namespace

TEST(CooperativeStepper, RunsToCompletionAndCleansUp) {
    LegacyFixture fx;
    AddScript(*fx.home, "hello.script", "print(\"hello \", args[1])\n", 2.0);

    auto record = LaunchRecord(fx.engine, *fx.home, "hello.script", { Value("world") });
    ASSERT_NE(record->GetPid(), InvalidProcessId);
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 2.0);

    EXPECT_TRUE(fx.engine.RunUntilIdle(1000));
    EXPECT_TRUE(HasLog(*record, "hello world"));
    EXPECT_TRUE(HasLog(*record, "Script finished running"));
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
    EXPECT_TRUE(fx.home->RunningScripts().empty());
    EXPECT_EQ(fx.engine.GetProcess(record->GetPid()), nullptr);
}

TEST(CooperativeStepper, SleepBlocksUntilTimerFires) {
    LegacyFixture fx;
    AddScript(*fx.home, "nap.script", "print(\"before\")\nsleep(500)\nprint(\"after\")\n");
    auto record = LaunchRecord(fx.engine, *fx.home, "nap.script");

    fx.engine.Tick(100);
    EXPECT_TRUE(HasLog(*record, "before"));
    EXPECT_TRUE(HasLog(*record, "sleep: Sleeping for 500 milliseconds"));
    EXPECT_FALSE(HasLog(*record, "after"));

    fx.engine.Tick(500);
    EXPECT_TRUE(HasLog(*record, "after"));
    EXPECT_TRUE(HasLog(*record, "Script finished running"));
}

TEST(CooperativeStepper, BusyLoopIsSteppedAndCanBeKilled) {
    HostSettingsData settings = FastSettings();
    settings.instructionsPerStep = 100;
    settings.instructionTimeSliceMs = 10;
    LegacyFixture fx(settings);
    AddScript(*fx.home, "spin.script", "local i = 0\nwhile true do i = i + 1 end\n", 4.0);

    auto record = LaunchRecord(fx.engine, *fx.home, "spin.script");
    const ProcessId pid = record->GetPid();

    bool otherTaskRan = false;
    fx.engine.Loop().Schedule(25, [&]() { otherTaskRan = true; });
    fx.engine.Tick(50);
    EXPECT_TRUE(otherTaskRan);
    ASSERT_NE(fx.engine.GetProcess(pid), nullptr);

    EXPECT_TRUE(fx.engine.KillProcess(pid));
    EXPECT_FALSE(fx.engine.KillProcess(pid));
    fx.engine.Tick(20);

    EXPECT_TRUE(HasLog(*record, "Script killed"));
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
    EXPECT_TRUE(fx.engine.Loop().Empty());
}

TEST(CooperativeStepper, LongComputationSpansManySteps) {
    HostSettingsData settings = FastSettings();
    settings.instructionsPerStep = 100;
    settings.instructionTimeSliceMs = 10;
    LegacyFixture fx(settings);
    AddScript(*fx.home, "count.script", "local n = 0\nfor i = 1, 20000 do n = n + i end\nprint(n)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "count.script");
    fx.engine.Tick(10);
    EXPECT_FALSE(HasLog(*record, "200010000"));

    EXPECT_TRUE(fx.engine.RunUntilIdle(100000000));
    EXPECT_TRUE(HasLog(*record, "200010000"));
}

TEST(CooperativeStepper, ImportsAreInlinedAndErrorLinesMapBack) {
    LegacyFixture fx;
    AddScript(*fx.home, "lib.script", "function double(x)\n  return x * 2\nend\n");
    AddScript(*fx.home, "main.script",
        "import { double } from \"lib.script\"\n"
        "print(double(21))\n"
        "error(\"boom\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "main.script");
    fx.engine.RunUntilIdle(1000);

    EXPECT_TRUE(HasLog(*record, "42"));
    EXPECT_TRUE(HasLog(*record, "Script crashed with runtime error"));
    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_EQ(fx.notifier->notices[0], "RUNTIME ERROR\nmain.script@home\n\nmain.script:3: boom");
}

TEST(CooperativeStepper, CrashNoticeListsArguments) {
    LegacyFixture fx;
    AddScript(*fx.home, "fail.script", "error(\"bad target\", 0)\n");
    LaunchRecord(fx.engine, *fx.home, "fail.script", { Value("n00dles"), Value(3) });
    fx.engine.RunUntilIdle(1000);

    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_EQ(fx.notifier->notices[0], "RUNTIME ERROR\nfail.script@home\nArgs: [n00dles, 3]\n\nbad target");
}

TEST(CooperativeStepper, MissingImportIsReportedBeforeRunning) {
    LegacyFixture fx;
    AddScript(*fx.home, "main.script", "import * as lib from \"gone.script\"\nprint(\"ran\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "main.script");
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
    fx.engine.RunUntilIdle(1000);

    EXPECT_FALSE(HasLog(*record, "ran"));
    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_EQ(fx.notifier->notices[0],
        "Error processing Imports in main.script:\n'Import' failed due to invalid script: gone.script");
    EXPECT_TRUE(fx.home->RunningScripts().empty());
}

TEST(CooperativeStepper, SyntaxErrorIsReportedBeforeRunning) {
    LegacyFixture fx;
    AddScript(*fx.home, "typo.script", "print(\"x\"\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "typo.script");
    fx.engine.RunUntilIdle(1000);

    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_EQ(fx.notifier->notices[0].rfind("Syntax ERROR in typo.script:\n", 0), 0u);
    EXPECT_EQ(fx.engine.GetProcess(record->GetPid()), nullptr);
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}

TEST(CooperativeStepper, HostErrorsCanBeCaughtByTheScript) {
    LegacyFixture fx;
    AddScript(*fx.home, "ports.script",
        "local ok, err = pcall(readPort, 99)\n"
        "print(ok)\n"
        "print(err)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "ports.script");
    fx.engine.RunUntilIdle(1000);

    EXPECT_TRUE(HasLog(*record, "false"));
    EXPECT_TRUE(HasLog(*record, "Trying to use an invalid port: 99"));
    EXPECT_TRUE(HasLog(*record, "Script finished running"));
    EXPECT_TRUE(fx.notifier->notices.empty());
}

TEST(CooperativeStepper, UncaughtHostErrorCrashesTheScript) {
    LegacyFixture fx;
    AddScript(*fx.home, "ports.script", "readPort(0)\n");
    LaunchRecord(fx.engine, *fx.home, "ports.script");
    fx.engine.RunUntilIdle(1000);

    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_NE(fx.notifier->notices[0].find("Trying to use an invalid port: 0. Only ports 1-20 are valid."),
              std::string::npos);
}

TEST(CooperativeStepper, ExitStopsTheScriptImmediately) {
    LegacyFixture fx;
    AddScript(*fx.home, "quit.script", "print(\"a\")\nexit()\nprint(\"b\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "quit.script");
    fx.engine.RunUntilIdle(1000);

    EXPECT_TRUE(HasLog(*record, "a"));
    EXPECT_TRUE(HasLog(*record, "exit: Exiting..."));
    EXPECT_FALSE(HasLog(*record, "b"));
    EXPECT_TRUE(HasLog(*record, "Script killed"));
    EXPECT_TRUE(fx.notifier->notices.empty());
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}

TEST(CooperativeStepper, BlockingGameActionReturnsItsResult) {
    LegacyFixture fx;
    auto game = std::make_shared<FakeGame>();
    fx.engine.SetGameFunctions(game);
    AddScript(*fx.home, "hack.script", "local stolen = hack(\"n00dles\")\nprint(\"stole \", stolen)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "hack.script");
    fx.engine.Tick(500);
    EXPECT_FALSE(HasLog(*record, "stole"));

    fx.engine.Tick(600);
    EXPECT_TRUE(HasLog(*record, "stole 100"));
    EXPECT_EQ(game->actionsSettled, 1);
}

TEST(CooperativeStepper, RejectedGameActionRaisesInTheScript) {
    LegacyFixture fx;
    auto game = std::make_shared<FakeGame>();
    game->failActions = true;
    fx.engine.SetGameFunctions(game);
    AddScript(*fx.home, "hack.script", "hack(\"n00dles\")\nprint(\"unreachable\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "hack.script");
    fx.engine.RunUntilIdle(5000);

    EXPECT_FALSE(HasLog(*record, "unreachable"));
    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_NE(fx.notifier->notices[0].find("target is unreachable"), std::string::npos);
}

TEST(CooperativeStepper, GameFunctionsAreAbsentWithoutProvider) {
    LegacyFixture fx;
    AddScript(*fx.home, "check.script", "print(hack == nil)\n");
    auto record = LaunchRecord(fx.engine, *fx.home, "check.script");
    fx.engine.RunUntilIdle(1000);
    EXPECT_TRUE(HasLog(*record, "true"));
}

TEST(CooperativeStepper, GuestCoroutinesRunButCannotCallHostFunctions) {
    LegacyFixture fx;
    AddScript(*fx.home, "co.script",
        "local co = coroutine.create(function() local s = 0 for i = 1, 5000 do s = s + 1 end return s end)\n"
        "local ok, v = coroutine.resume(co)\n"
        "print(v)\n"
        "local ok2, err = coroutine.resume(coroutine.create(function() print(\"inner\") end))\n"
        "print(ok2)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "co.script");
    fx.engine.RunUntilIdle(1000);

    EXPECT_TRUE(HasLog(*record, "5000"));
    EXPECT_FALSE(HasLog(*record, "inner"));
    EXPECT_TRUE(HasLog(*record, "false"));
}

TEST(CooperativeStepper, MisbehavingTostringOnErrorObjectIsContained) {
    LegacyFixture fx;
    AddScript(*fx.home, "raises.script",
        "error(setmetatable({}, { __tostring = function() error(\"inner\") end }))\n");
    AddScript(*fx.home, "table.script",
        "error(setmetatable({}, { __tostring = function() return {} end }))\n");
    AddScript(*fx.home, "after.script", "sleep(20)\nprint(\"still here\")\n");

    auto bystander = LaunchRecord(fx.engine, *fx.home, "after.script");
    auto raises = LaunchRecord(fx.engine, *fx.home, "raises.script");
    auto table = LaunchRecord(fx.engine, *fx.home, "table.script");
    EXPECT_TRUE(fx.engine.RunUntilIdle(1000));

    ASSERT_EQ(fx.notifier->notices.size(), 2u);
    EXPECT_EQ(fx.notifier->notices[0], "An unknown script died for an unknown reason. This is a bug please contact game dev");
    EXPECT_EQ(fx.notifier->notices[1], fx.notifier->notices[0]);
    EXPECT_EQ(fx.engine.GetProcess(raises->GetPid()), nullptr);
    EXPECT_EQ(fx.engine.GetProcess(table->GetPid()), nullptr);
    EXPECT_TRUE(HasLog(*bystander, "still here"));
}
