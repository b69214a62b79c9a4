//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_bridge_process.cpp
// Purpose: Tests for bridge process launch, reuse and teardown
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include <signal.h>
#include <unistd.h>

#include "toolhost/BridgeProcess.hpp"

using namespace toolhost;
using namespace std::chrono_literals;

TEST(BridgeProcessTest, StartsOnceAndStops) {
    BridgeProcess bridge("svc", BridgeDefinition{"/bin/sleep", {"30"}, ""});
    EXPECT_FALSE(bridge.IsRunning());
    ASSERT_FALSE(bridge.Start(100ms).has_value());
    EXPECT_TRUE(bridge.IsRunning());
    const int pid = bridge.Pid();
    EXPECT_GT(pid, 0);

    // Already running: no second process
    ASSERT_FALSE(bridge.Start(100ms).has_value());
    EXPECT_EQ(bridge.Pid(), pid);

    bridge.Stop(500ms);
    EXPECT_FALSE(bridge.IsRunning());
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST(BridgeProcessTest, RunsInConfiguredDirectory) {
    char tmpl[] = "/tmp/toolhost-bridge-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    const std::string dir = tmpl;

    BridgeProcess bridge("svc", BridgeDefinition{"/bin/sh", {"-c", "pwd > marker.txt; sleep 30"}, dir});
    ASSERT_FALSE(bridge.Start(300ms).has_value());
    std::ifstream in(dir + "/marker.txt");
    std::string written;
    std::getline(in, written);
    EXPECT_NE(written.find("toolhost-bridge-"), std::string::npos);
    bridge.Stop(500ms);

    std::remove((dir + "/marker.txt").c_str());
    ::rmdir(dir.c_str());
}

TEST(BridgeProcessTest, StopKillsWholeProcessGroup) {
    BridgeProcess bridge("svc", BridgeDefinition{"/bin/sh", {"-c", "sleep 30 & wait"}, ""});
    ASSERT_FALSE(bridge.Start(200ms).has_value());
    bridge.Stop(500ms);
    EXPECT_FALSE(bridge.IsRunning());
}

TEST(BridgeProcessTest, ExitDuringSettleIsReported) {
    BridgeProcess bridge("svc", BridgeDefinition{"/bin/false", {}, ""});
    auto err = bridge.Start(300ms);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, errors::ErrorCode::SpawnFailed);
    EXPECT_FALSE(bridge.IsRunning());

    // A dead bridge may be started again
    auto again = bridge.Start(300ms);
    EXPECT_TRUE(again.has_value());
}
