//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameCodec.h
// Purpose: Newline-delimited JSON-RPC framing for tool-server stdio streams.
//========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

// Any message a peer may send on one line.
using DecodedMessage = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

//========================================================================================================
// FrameCodec
// Purpose: Converts between JSON-RPC message objects and single-line frames.
// Methods:
//   Encode(message): Serialized message followed by exactly one '\n'.
//   Decode(line): Parses one frame (a trailing "\r\n" or "\n" is ignored). Input that is not a JSON
//                 object, or an object that is neither request, notification nor response, yields
//                 a MalformedFrame error.
//========================================================================================================
class FrameCodec {
public:
    static std::string Encode(const JSONRPCMessage& message);
    static Result<DecodedMessage> Decode(const std::string& line);
};

//========================================================================================================
// LineFramer
// Purpose: Incremental splitter that extracts complete lines from a growing byte buffer.
// Notes:
//   Blank lines are skipped. A line longer than maxLineLength is dropped up to its terminating newline
//   and reported once as LineTooLong.
//========================================================================================================
class LineFramer {
public:
    enum class DecodeStatus {
        Ok,
        Incomplete,
        LineTooLong
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };

    explicit LineFramer(std::size_t maxLineLength = 4 * 1024 * 1024) : maxLineLength(maxLineLength) {}

    DecodeResult tryDecodeEx(const std::string& buffer);

    // Extracts the next complete line and erases it (and anything dropped before it) from buffer.
    std::optional<std::string> tryDecode(std::string& buffer);

private:
    std::size_t maxLineLength;
    bool discarding{false};
};

} // namespace toolhost
