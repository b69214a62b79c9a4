//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error values, result wrapper and JSON-RPC error mapping helpers for toolhost.
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Failure taxonomy surfaced by every toolhost component.
enum class ErrorCode {
    SpawnFailed,
    HandshakeFailed,
    MalformedFrame,
    RequestTimeout,
    CallTimeout,
    ToolError,
    ServerNotConnected,
    ConfigParseError,
    ProcessExited
};

// Typed error representation. rpcCode is set when the error came from a JSON-RPC error object.
struct ToolhostError {
    ErrorCode code{ErrorCode::ToolError};
    std::string message;
    std::optional<int> rpcCode;
};

inline ToolhostError makeError(ErrorCode code, std::string message) {
    ToolhostError e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

// Stable name of an error code ("CallTimeout", ...), used in logs and tests.
const char* errorCodeName(ErrorCode code);

//==========================================================================================================
// toUserText
// Purpose: Short, caller-facing description of an error, free of internals.
// Examples:
//   "Error: server not connected", "Error: call timed out", "Error: tool error -32000: boom"
//==========================================================================================================
std::string toUserText(const ToolhostError& err);

//==========================================================================================================
// toolErrorFromErrorValue
// Purpose: Convert a JSON-RPC error object (shape: { code, message, data? }) into a ToolError.
// Args:
//   errVal: JSONValue expected to be an Object with code/message.
// Returns:
//   ToolhostError with code ToolError. Objects missing code or message still yield an error whose
//   message is the serialized object, so a remote failure is never reported as success.
//==========================================================================================================
ToolhostError toolErrorFromErrorValue(const JSONValue& errVal);

// ToolError from a response that carries an error; std::nullopt for success responses.
std::optional<ToolhostError> toolErrorFromResponse(const JSONRPCResponse& response);

} // namespace errors

//==========================================================================================================
// Result
// Purpose: Value-or-error return used where an operation produces data. The value is always present
//          (default or fallback on failure) so callers that tolerate failure can use it directly.
//==========================================================================================================
template <typename T>
struct Result {
    T value{};
    std::optional<errors::ToolhostError> error;

    bool ok() const { return !error.has_value(); }

    static Result Success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result Failure(errors::ToolhostError e, T fallback = T{}) {
        Result r;
        r.value = std::move(fallback);
        r.error = std::move(e);
        return r;
    }
};

} // namespace toolhost
