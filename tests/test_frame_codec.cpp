//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_frame_codec.cpp
// Purpose: Tests for newline-delimited JSON-RPC framing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "toolhost/FrameCodec.h"

using namespace toolhost;

TEST(FrameCodecTest, EncodedRequestIsOneLine) {
    JSONValue::Object params;
    params["text"] = MakeJSON("multi\nline");
    JSONRPCRequest req(JSONRPCId(int64_t{7}), "tools/call", JSONValue(params));
    const std::string frame = FrameCodec::Encode(req);
    ASSERT_FALSE(frame.empty());
    EXPECT_EQ(frame.back(), '\n');
    EXPECT_EQ(frame.find('\n'), frame.size() - 1);
}

TEST(FrameCodecTest, RequestDecodesWithSameId) {
    JSONRPCRequest req(JSONRPCId(int64_t{42}), "tools/list", JSONValue(JSONValue::Object{}));
    auto decoded = FrameCodec::Decode(FrameCodec::Encode(req));
    ASSERT_TRUE(decoded.ok());
    const auto* back = std::get_if<JSONRPCRequest>(&decoded.value);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(std::get<int64_t>(back->id), 42);
    EXPECT_EQ(back->method, "tools/list");
}

TEST(FrameCodecTest, StringIdsArePreserved) {
    auto decoded = FrameCodec::Decode(R"({"jsonrpc":"2.0","id":"abc","result":{}})");
    ASSERT_TRUE(decoded.ok());
    const auto* resp = std::get_if<JSONRPCResponse>(&decoded.value);
    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(std::get<std::string>(resp->id), "abc");
    EXPECT_EQ(IdToString(resp->id), "\"abc\"");
}

TEST(FrameCodecTest, ClassifiesMessageKinds) {
    auto note = FrameCodec::Decode(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})");
    ASSERT_TRUE(note.ok());
    EXPECT_NE(std::get_if<JSONRPCNotification>(&note.value), nullptr);

    auto err = FrameCodec::Decode("{\"jsonrpc\":\"2.0\",\"id\":3,\"error\":{\"code\":-32000,\"message\":\"boom\"}}\r\n");
    ASSERT_TRUE(err.ok());
    const auto* resp = std::get_if<JSONRPCResponse>(&err.value);
    ASSERT_NE(resp, nullptr);
    EXPECT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(resp->error.value(), "code").value_or(0), -32000);
}

TEST(FrameCodecTest, NonJsonLineIsMalformed) {
    auto decoded = FrameCodec::Decode("Starting server on stdio...");
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error->code, errors::ErrorCode::MalformedFrame);
}

TEST(FrameCodecTest, StructurallyInvalidFramesAreMalformed) {
    for (const char* line : {"", "[1,2]", "{\"jsonrpc\":\"2.0\"}", "{\"method\":5}",
                             "{\"result\":{}}", "{\"id\":{},\"result\":{}}", "{\"id\":1,\"method\":\"\"}"}) {
        auto decoded = FrameCodec::Decode(line);
        EXPECT_FALSE(decoded.ok()) << line;
        if (!decoded.ok()) {
            EXPECT_EQ(decoded.error->code, errors::ErrorCode::MalformedFrame) << line;
        }
    }
}

TEST(FrameCodecTest, ExtremeNumbersDoNotRejectTheFrame) {
    for (const char* line : {R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"ok"}],"x":1e-320}})",
                             R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"ok"}],"x":1e400}})",
                             R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"ok"}],"x":-1e400}})"}) {
        auto decoded = FrameCodec::Decode(line);
        ASSERT_TRUE(decoded.ok()) << line << ": " << decoded.error->message;
        const auto* resp = std::get_if<JSONRPCResponse>(&decoded.value);
        ASSERT_NE(resp, nullptr);
        EXPECT_EQ(std::get<int64_t>(resp->id), 2);
        ASSERT_TRUE(resp->result.has_value());
        EXPECT_NE(GetArray(*resp->result, "content"), nullptr);
    }
}

TEST(FrameCodecTest, ResponseWithoutResultStillEncodesResult) {
    JSONRPCResponse resp;
    resp.id = int64_t{1};
    auto decoded = FrameCodec::Decode(FrameCodec::Encode(resp));
    ASSERT_TRUE(decoded.ok());
    const auto* back = std::get_if<JSONRPCResponse>(&decoded.value);
    ASSERT_NE(back, nullptr);
    EXPECT_FALSE(back->IsError());
    ASSERT_TRUE(back->result.has_value());
    EXPECT_TRUE(back->result->IsObject());
}

TEST(LineFramerTest, SplitsLinesAndKeepsPartialTail) {
    LineFramer framer;
    std::string buffer = "first\r\n\nsecond\npart";
    auto a = framer.tryDecode(buffer);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a.value(), "first");
    auto b = framer.tryDecode(buffer);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b.value(), "second");
    EXPECT_FALSE(framer.tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "part");
    buffer += "ial\n";
    auto c = framer.tryDecode(buffer);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c.value(), "partial");
}

TEST(LineFramerTest, DropsOverlongLinesAndRecovers) {
    LineFramer framer(8);
    std::string buffer = "0123456789abcdef";
    auto ex = framer.tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, LineFramer::DecodeStatus::LineTooLong);
    buffer.erase(0, ex.bytesConsumed);
    buffer += "tail\nok\n";
    auto line = framer.tryDecode(buffer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line.value(), "ok");
}
