// File: Tests/NativeRunnerTests.cpp
// Purpose: Native-mode execution: promise-returning host calls, await, call serialization and
//          how a concurrency violation ends the process.
// Key invariants: Only sleep may overlap a pending host call; a violation crashes the process
//                 even when the script catches the error.

#include <gtest/gtest.h>

#include "TestSupport.h"

using namespace WorkerHostTest;

namespace {

    struct NativeFixture {
        std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
        std::shared_ptr<FakeGame> game = std::make_shared<FakeGame>();
        ProcessEngine engine{ FastSettings(), notifier };
        ServerPtr home = MakeServer("home", 32.0);

        NativeFixture() {
            engine.AddServer(home);
            engine.SetGameFunctions(game);
        }
    };

} // namespace

TEST(NativeRunner, AwaitedSleepSuspendsTheScript) {
    NativeFixture fx;
    AddScript(*fx.home, "nap.lua", "local p = sleep(100)\nawait(p)\nprint(\"slept\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "nap.lua");
    fx.engine.Tick(50);
    EXPECT_FALSE(HasLog(*record, "slept"));

    fx.engine.Tick(60);
    EXPECT_TRUE(HasLog(*record, "slept"));
    EXPECT_TRUE(HasLog(*record, "Script finished running"));
}

TEST(NativeRunner, AwaitMethodReturnsTheResolvedValue) {
    NativeFixture fx;
    AddScript(*fx.home, "hack.lua", "local v = hack(\"n00dles\"):await()\nprint(\"stole \", v)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "hack.lua");
    EXPECT_TRUE(fx.engine.RunUntilIdle(5000));
    EXPECT_TRUE(HasLog(*record, "stole 100"));
}

TEST(NativeRunner, AwaitPassesNonPromisesThrough) {
    NativeFixture fx;
    AddScript(*fx.home, "plain.lua", "print(await(7))\nprint(await(getHostname()))\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "plain.lua");
    fx.engine.RunUntilIdle(1000);
    EXPECT_TRUE(HasLog(*record, "7"));
    EXPECT_TRUE(HasLog(*record, "home"));
}

TEST(NativeRunner, SecondCallWhilePendingCrashesWithBothNames) {
    NativeFixture fx;
    AddScript(*fx.home, "greedy.lua", "local a = hack(\"n00dles\")\nlocal b = grow(\"n00dles\")\nprint(\"after\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "greedy.lua");
    fx.engine.RunUntilIdle(5000);

    EXPECT_FALSE(HasLog(*record, "after"));
    EXPECT_TRUE(HasLog(*record, "Script crashed with runtime error"));
    ASSERT_EQ(fx.notifier->notices.size(), 1u);
    EXPECT_NE(fx.notifier->notices[0].find("Concurrent calls to Netscript functions not allowed!"), std::string::npos);
    EXPECT_NE(fx.notifier->notices[0].find("Currently running: hack tried to run: grow"), std::string::npos);
    EXPECT_EQ(fx.notifier->notices[0].rfind("RUNTIME ERROR\ngreedy.lua@home\n", 0), 0u);
    EXPECT_EQ(fx.game->actionsStarted, 1);
}

TEST(NativeRunner, CatchingTheViolationDoesNotSaveTheProcess) {
    NativeFixture fx;
    AddScript(*fx.home, "sneaky.lua",
        "local a = hack(\"n00dles\")\n"
        "local ok = pcall(grow, \"n00dles\")\n"
        "print(\"caught \", ok)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "sneaky.lua");
    fx.engine.RunUntilIdle(5000);

    EXPECT_TRUE(HasLog(*record, "Script crashed with runtime error"));
    EXPECT_FALSE(HasLog(*record, "Script finished running"));
    EXPECT_EQ(fx.notifier->notices.size(), 1u);
}

TEST(NativeRunner, SleepMayOverlapAPendingAction) {
    NativeFixture fx;
    AddScript(*fx.home, "overlap.lua",
        "local h = hack(\"n00dles\")\n"
        "await(sleep(10))\n"
        "local v = await(h)\n"
        "print(\"done \", v)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "overlap.lua");
    EXPECT_TRUE(fx.engine.RunUntilIdle(5000));
    EXPECT_TRUE(HasLog(*record, "done 100"));
    EXPECT_TRUE(fx.notifier->notices.empty());
}

TEST(NativeRunner, SequentialAwaitedCallsAreAllowed) {
    NativeFixture fx;
    AddScript(*fx.home, "loop.lua",
        "for i = 1, 3 do\n"
        "  await(weaken(\"n00dles\"))\n"
        "  await(grow(\"n00dles\"))\n"
        "end\n"
        "print(\"cycles done\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "loop.lua");
    EXPECT_TRUE(fx.engine.RunUntilIdle(100000));
    EXPECT_TRUE(HasLog(*record, "cycles done"));
    EXPECT_EQ(fx.game->actionsSettled, 6);
}

TEST(NativeRunner, KillDuringAwaitStopsWithoutCrash) {
    NativeFixture fx;
    AddScript(*fx.home, "long.lua", "await(sleep(100000))\nprint(\"woke\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "long.lua");
    fx.engine.Tick(10);
    EXPECT_TRUE(fx.engine.KillProcess(record->GetPid()));
    fx.engine.Tick(10);

    EXPECT_TRUE(HasLog(*record, "Script killed"));
    EXPECT_FALSE(HasLog(*record, "woke"));
    EXPECT_TRUE(fx.notifier->notices.empty());
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}

TEST(NativeRunner, PlainYieldResumesOnTheNextTick) {
    NativeFixture fx;
    AddScript(*fx.home, "yield.lua", "coroutine.yield()\nprint(\"resumed\")\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "yield.lua");
    fx.engine.Loop().RunPending();
    EXPECT_FALSE(HasLog(*record, "resumed"));
    fx.engine.Tick(1);
    EXPECT_TRUE(HasLog(*record, "resumed"));
}

TEST(NativeRunner, QueriesReturnStructuredValues) {
    NativeFixture fx;
    AddScript(*fx.home, "info.lua", "local s = getServer()\nprint(s.hostname, \":\", s.maxRam)\n");

    auto record = LaunchRecord(fx.engine, *fx.home, "info.lua");
    fx.engine.RunUntilIdle(1000);
    EXPECT_TRUE(HasLog(*record, "home:32"));
}

TEST(NativeRunner, NonStringErrorObjectsAreReported) {
    NativeFixture fx;
    AddScript(*fx.home, "table.lua", "error({ code = 1 })\n");
    AddScript(*fx.home, "meta.lua",
        "error(setmetatable({}, { __tostring = function() return \"custom failure\" end }))\n");

    LaunchRecord(fx.engine, *fx.home, "table.lua");
    LaunchRecord(fx.engine, *fx.home, "meta.lua");
    fx.engine.RunUntilIdle(1000);

    ASSERT_EQ(fx.notifier->notices.size(), 2u);
    EXPECT_TRUE(fx.notifier->Noticed("An unknown script died for an unknown reason"));
    EXPECT_TRUE(fx.notifier->Noticed("custom failure"));
}

TEST(NativeRunner, MisbehavingTostringOnErrorObjectIsContained) {
    NativeFixture fx;
    AddScript(*fx.home, "raises.lua",
        "error(setmetatable({}, { __tostring = function() error(\"inner\") end }))\n");
    AddScript(*fx.home, "table.lua",
        "error(setmetatable({}, { __tostring = function() return {} end }))\n");
    AddScript(*fx.home, "spins.lua",
        "error(setmetatable({}, { __tostring = function() while true do end end }))\n");
    AddScript(*fx.home, "bystander.lua", "await(sleep(50))\nprint(\"still here\")\n");

    auto bystander = LaunchRecord(fx.engine, *fx.home, "bystander.lua");
    LaunchRecord(fx.engine, *fx.home, "raises.lua");
    LaunchRecord(fx.engine, *fx.home, "table.lua");
    LaunchRecord(fx.engine, *fx.home, "spins.lua");
    EXPECT_TRUE(fx.engine.RunUntilIdle(1000));

    ASSERT_EQ(fx.notifier->notices.size(), 3u);
    for (const auto& notice : fx.notifier->notices) {
        EXPECT_EQ(notice, "An unknown script died for an unknown reason. This is a bug please contact game dev");
    }
    EXPECT_TRUE(HasLog(*bystander, "still here"));
    EXPECT_DOUBLE_EQ(fx.home->Ram().Reserved(), 0.0);
}
