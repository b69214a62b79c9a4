//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_process.cpp
// Purpose: End-to-end tests of one tool-server connection against the fake tool server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "test_support.h"
#include "toolhost/ServerProcess.hpp"

using namespace toolhost;
using namespace toolhost_test;
using namespace std::chrono_literals;
using errors::ErrorCode;

namespace {

JSONValue argsWith(const std::string& key, const std::string& value) {
    JSONValue::Object o;
    o[key] = MakeJSON(value);
    return JSONValue(o);
}

} // namespace

TEST(ServerProcessTest, HandshakeReportsServerInfo) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    EXPECT_EQ(p.State(), ConnectionState::Starting);
    ASSERT_FALSE(p.Start(3s).has_value());
    EXPECT_EQ(p.State(), ConnectionState::Connected);
    EXPECT_TRUE(p.IsUsable());
    EXPECT_GT(p.Pid(), 0);
    EXPECT_EQ(p.ServerInfo().name, "fake-tool-server");
    EXPECT_EQ(p.ServerInfo().version, "1.0.0");
    EXPECT_FALSE(p.Stop(1s).has_value());
    EXPECT_EQ(p.State(), ConnectionState::Stopped);
}

TEST(ServerProcessTest, ListsAdvertisedTools) {
    ServerProcess p("echo-server", fakeServerPath(), {"--tools=ping,echo"}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto tools = p.ListTools(2s);
    ASSERT_TRUE(tools.ok());
    ASSERT_EQ(tools.value.size(), 2u);
    for (const auto& t : tools.value) {
        EXPECT_EQ(t.server, "echo-server");
        EXPECT_TRUE(t.inputSchema.IsObject());
        EXPECT_EQ(GetString(t.inputSchema, "type").value_or(""), "object");
    }
    EXPECT_EQ(tools.value[0].QualifiedName(), "mcp_echo_server_echo");
    EXPECT_EQ(tools.value[1].QualifiedName(), "mcp_echo_server_ping");
}

TEST(ServerProcessTest, FollowsListCursor) {
    ServerProcess p("paged", fakeServerPath(), {"--tools=a1,a2,a3,a4,a5", "--page-size=2"}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto tools = p.ListTools(2s);
    ASSERT_TRUE(tools.ok());
    EXPECT_EQ(tools.value.size(), 5u);
}

TEST(ServerProcessTest, CallReturnsToolText) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());

    auto pong = p.CallTool("ping", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(pong.ok());
    EXPECT_EQ(pong.value, "pong");

    auto echo = p.CallTool("echo", argsWith("text", "hello there"), 2s);
    ASSERT_TRUE(echo.ok());
    EXPECT_EQ(echo.value, "hello there");

    auto multi = p.CallTool("multi", JSONValue(), 2s);
    ASSERT_TRUE(multi.ok());
    EXPECT_EQ(multi.value, "first\nsecond");

    auto raw = p.CallTool("raw", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value, "{\"value\":42}");
}

TEST(ServerProcessTest, EnvironmentReachesServer) {
    ServerProcess p("fake", fakeServerPath(), {}, {{"TOOLHOST_FAKE_SECRET", "s3cret"}}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto r = p.CallTool("env", argsWith("name", "TOOLHOST_FAKE_SECRET"), 2s);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, "s3cret");
}

TEST(ServerProcessTest, RemoteErrorsBecomeToolErrors) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());

    auto fail = p.CallTool("fail", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_FALSE(fail.ok());
    EXPECT_EQ(fail.error->code, ErrorCode::ToolError);
    EXPECT_EQ(fail.error->rpcCode.value_or(0), -32000);
    EXPECT_EQ(errors::toUserText(fail.error.value()), "Error: tool error -32000: boom");

    auto flagged = p.CallTool("is_error", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_FALSE(flagged.ok());
    EXPECT_EQ(flagged.error->code, ErrorCode::ToolError);
    EXPECT_EQ(flagged.error->message, "bad input");

    auto unknown = p.CallTool("no_such_tool", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error->rpcCode.value_or(0), JSONRPCErrorCodes::ToolNotFound);

    // The connection survives remote errors
    EXPECT_TRUE(p.CallTool("ping", JSONValue(JSONValue::Object{}), 2s).ok());
}

TEST(ServerProcessTest, SilentCallTimesOutAndConnectionRecovers) {
    ServerProcess p("fake", fakeServerPath(), {"--hang-first-call"}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());

    const auto t0 = std::chrono::steady_clock::now();
    auto first = p.CallTool("ping", JSONValue(JSONValue::Object{}), 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.error->code, ErrorCode::CallTimeout);
    EXPECT_LT(elapsed, 300ms + 700ms);

    auto second = p.CallTool("ping", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value, "pong");
}

TEST(ServerProcessTest, NoiseOnStdoutIsSkipped) {
    ServerProcess p("noisy", fakeServerPath(), {"--noise"}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto r = p.CallTool("ping", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, "pong");
    EXPECT_GE(p.MalformedFrameCount(), 2u);
}

TEST(ServerProcessTest, MalformedLineDoesNotStopReader) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    ServerProcessTestHooks::feedStdoutLine(p, "{not json");
    ServerProcessTestHooks::feedStdoutLine(p, R"({"jsonrpc":"2.0","id":999,"result":{}})");
    ServerProcessTestHooks::feedStdoutLine(p, R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})");
    EXPECT_EQ(p.MalformedFrameCount(), 1u);
    auto r = p.CallTool("echo", argsWith("text", "still here"), 2s);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, "still here");
}

TEST(ServerProcessTest, StderrChatterDoesNotInterfere) {
    ServerProcess p("chatty", fakeServerPath(), {"--stderr-chatter"}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    for (int k = 0; k < 5; ++k) {
        ASSERT_TRUE(p.CallTool("ping", JSONValue(JSONValue::Object{}), 2s).ok());
    }
}

TEST(ServerProcessTest, AnswersServerInitiatedRequests) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto ping = p.CallTool("client_ping", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(ping.ok());
    EXPECT_EQ(ping.value, "client answered ping");
    auto unknown = p.CallTool("client_unknown", JSONValue(JSONValue::Object{}), 2s);
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.value, "client error -32601");
}

TEST(ServerProcessTest, MissingHandshakeFailsStart) {
    ServerProcess p("mute", fakeServerPath(), {"--no-handshake"}, {}, fastProcessOptions());
    auto err = p.Start(300ms);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::HandshakeFailed);
    EXPECT_EQ(p.State(), ConnectionState::Failed);
    auto call = p.CallTool("ping", JSONValue(JSONValue::Object{}), 1s);
    ASSERT_FALSE(call.ok());
    EXPECT_EQ(call.error->code, ErrorCode::ServerNotConnected);
}

TEST(ServerProcessTest, EarlyExitIsSpawnFailureWithStderr) {
    ServerProcess p("dies", fakeServerPath(), {"--exit-immediately"}, {}, fastProcessOptions());
    auto err = p.Start(2s);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::SpawnFailed);
    EXPECT_NE(err->message.find("status 3"), std::string::npos);
    EXPECT_NE(err->message.find("refusing to start"), std::string::npos);
    EXPECT_EQ(p.State(), ConnectionState::Failed);
}

TEST(ServerProcessTest, NonexistentCommandIsSpawnFailure) {
    ServerProcess p("ghost", "/nonexistent/echo-server", {}, {}, fastProcessOptions());
    auto err = p.Start(2s);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::SpawnFailed);
    EXPECT_EQ(p.State(), ConnectionState::Failed);
}

TEST(ServerProcessTest, StopTwiceIsNoOp) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    EXPECT_FALSE(p.Stop(1s).has_value());
    EXPECT_FALSE(p.Stop(1s).has_value());
    EXPECT_EQ(p.State(), ConnectionState::Stopped);
    auto call = p.CallTool("ping", JSONValue(JSONValue::Object{}), 1s);
    ASSERT_FALSE(call.ok());
    EXPECT_EQ(call.error->code, ErrorCode::ServerNotConnected);
}

TEST(ServerProcessTest, StartTwiceIsRejected) {
    ServerProcess p("fake", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto again = p.Start(3s);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(p.State(), ConnectionState::Connected);
}

TEST(ServerProcessTest, CrashDuringCallIsProcessExited) {
    ServerProcess p("fragile", fakeServerPath(), {}, {}, fastProcessOptions());
    ASSERT_FALSE(p.Start(3s).has_value());
    auto r = p.CallTool("crash", JSONValue(JSONValue::Object{}), 3s);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->code, ErrorCode::ProcessExited);
    EXPECT_FALSE(p.IsUsable());
    EXPECT_FALSE(p.Stop(1s).has_value());
}

TEST(ServerProcessTest, StopDuringHandshakeFailsStart) {
    ServerProcess p("mute", fakeServerPath(), {"--no-handshake"}, {}, fastProcessOptions());
    auto started = std::async(std::launch::async, [&p]() { return p.Start(10s); });
    std::this_thread::sleep_for(700ms);
    EXPECT_FALSE(p.Stop(500ms).has_value());
    ASSERT_EQ(started.wait_for(3s), std::future_status::ready);
    auto err = started.get();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::HandshakeFailed);
    EXPECT_EQ(p.State(), ConnectionState::Failed);
}
