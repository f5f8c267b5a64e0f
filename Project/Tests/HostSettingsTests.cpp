// File: Tests/HostSettingsTests.cpp
// Purpose: JSON settings loading: defaults for missing keys, clamping, and rejection of bad input.
// Key invariants: A failed load leaves the destination untouched.

#include <gtest/gtest.h>

#include "Settings/HostSettings.hpp"

TEST(HostSettings, MissingKeysKeepDefaults) {
    HostSettingsData data;
    ASSERT_TRUE(HostSettings::LoadFromString("{ \"numPorts\": 5 }", data));
    EXPECT_EQ(data.numPorts, 5);
    EXPECT_EQ(data.instructionTimeSliceMs, 50);
    EXPECT_EQ(data.instructionsPerStep, 100);
    EXPECT_EQ(data.idleSpeedMs, 200);
    EXPECT_EQ(data.maxPid, 2147483647);
    EXPECT_EQ(data.logLevel, "info");
    EXPECT_FALSE(data.skipScriptLoad);
}

TEST(HostSettings, OutOfRangeValuesAreClamped) {
    HostSettingsData data;
    ASSERT_TRUE(HostSettings::LoadFromString(
        "{ \"instructionTimeSliceMs\": 0, \"numPorts\": 5000, \"maxPid\": -3, \"maxLogCapacity\": 1e12 }", data));
    EXPECT_EQ(data.instructionTimeSliceMs, 1);
    EXPECT_EQ(data.numPorts, 1000);
    EXPECT_EQ(data.maxPid, 1);
    EXPECT_EQ(data.maxLogCapacity, 100000);
}

TEST(HostSettings, WrongTypesAreIgnored) {
    HostSettingsData data;
    ASSERT_TRUE(HostSettings::LoadFromString(
        "{ \"numPorts\": \"many\", \"skipScriptLoad\": 1, \"logLevel\": 4 }", data));
    EXPECT_EQ(data.numPorts, 20);
    EXPECT_FALSE(data.skipScriptLoad);
    EXPECT_EQ(data.logLevel, "info");
}

TEST(HostSettings, BadDocumentLeavesOutputUntouched) {
    HostSettingsData data;
    data.numPorts = 7;
    EXPECT_FALSE(HostSettings::LoadFromString("{ \"numPorts\": 3", data));
    EXPECT_FALSE(HostSettings::LoadFromString("[1, 2]", data));
    EXPECT_EQ(data.numPorts, 7);
    EXPECT_FALSE(HostSettings::LoadFromFile("does/not/exist.json", data));
    EXPECT_EQ(data.numPorts, 7);
}

TEST(HostSettings, JsonRoundTripKeepsEveryField) {
    HostSettingsData data;
    data.instructionTimeSliceMs = 5;
    data.maxConcurrentProcesses = 12;
    data.logLevel = "debug";
    data.logDirectory = "out/logs";
    data.skipScriptLoad = true;

    HostSettingsData loaded;
    ASSERT_TRUE(HostSettings::LoadFromString(HostSettings::ToJson(data), loaded));
    EXPECT_EQ(loaded.instructionTimeSliceMs, 5);
    EXPECT_EQ(loaded.maxConcurrentProcesses, 12);
    EXPECT_EQ(loaded.logLevel, "debug");
    EXPECT_EQ(loaded.logDirectory, "out/logs");
    EXPECT_TRUE(loaded.skipScriptLoad);
}
