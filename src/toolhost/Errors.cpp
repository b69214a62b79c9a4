//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Error code names, user-facing text and JSON-RPC error object mapping.
//==========================================================================================================

#include "toolhost/errors/Errors.h"

#include <format>
#include <limits>

namespace toolhost {
namespace errors {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SpawnFailed: return "SpawnFailed";
        case ErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ErrorCode::MalformedFrame: return "MalformedFrame";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::CallTimeout: return "CallTimeout";
        case ErrorCode::ToolError: return "ToolError";
        case ErrorCode::ServerNotConnected: return "ServerNotConnected";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::ProcessExited: return "ProcessExited";
    }
    return "Unknown";
}

std::string toUserText(const ToolhostError& err) {
    switch (err.code) {
        case ErrorCode::ServerNotConnected: return "Error: server not connected";
        case ErrorCode::CallTimeout:
        case ErrorCode::RequestTimeout: return "Error: call timed out";
        case ErrorCode::ProcessExited: return "Error: tool server exited";
        case ErrorCode::SpawnFailed: return "Error: tool server could not be started";
        case ErrorCode::HandshakeFailed: return "Error: tool server did not complete initialization";
        case ErrorCode::MalformedFrame: return "Error: malformed reply from tool server";
        case ErrorCode::ConfigParseError: return "Error: invalid tool server configuration";
        case ErrorCode::ToolError:
            if (err.rpcCode.has_value()) {
                return std::format("Error: tool error {}: {}", err.rpcCode.value(), err.message);
            }
            return std::format("Error: tool error: {}", err.message);
    }
    return "Error: unknown failure";
}

ToolhostError toolErrorFromErrorValue(const JSONValue& errVal) {
    ToolhostError e;
    e.code = ErrorCode::ToolError;
    auto code = GetInteger(errVal, "code");
    auto message = GetString(errVal, "message");
    const bool codeFits = code.has_value() && code.value() >= std::numeric_limits<int>::min()
                          && code.value() <= std::numeric_limits<int>::max();
    if (!codeFits || !message.has_value()) {
        e.message = SerializeJSON(errVal);
        return e;
    }
    e.rpcCode = static_cast<int>(code.value());
    e.message = message.value();
    return e;
}

std::optional<ToolhostError> toolErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return toolErrorFromErrorValue(response.error.value());
}

} // namespace errors
} // namespace toolhost
