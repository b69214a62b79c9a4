//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Single-outstanding-request exchange over one tool-server connection.
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

//==========================================================================================================
// RequestCorrelator
// Purpose: Serializes request/response traffic on a connection that has no multiplexing.
// Notes:
//   At most one exchange is in flight. Send() holds the exchange lock from the moment the frame is
//   written until the response arrives or the deadline passes, so requests reach the server in order.
//   Deliver() only fills the slot when the response id matches the armed request id; anything else
//   (typically a late answer to a request that already timed out) is dropped and logged.
//==========================================================================================================
class RequestCorrelator {
public:
    // Writes one encoded frame to the peer. Returns an error when the frame could not be written.
    using FrameWriter = std::function<std::optional<errors::ToolhostError>(const std::string& frame)>;

    RequestCorrelator(std::string connectionName, FrameWriter writer);

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //======================================================================================================
    // Send
    // Purpose: Assigns the next id, writes the request and waits for the matching response.
    // Args:
    //   method/params: JSON-RPC request content.
    //   timeout: Bound on the whole exchange, including waiting for a previous exchange to finish.
    // Returns:
    //   The response (which may itself carry a JSON-RPC error object), or RequestTimeout, or the
    //   error passed to Close(), or the writer's error.
    //======================================================================================================
    Result<JSONRPCResponse> Send(const std::string& method, std::optional<JSONValue> params,
                                 std::chrono::milliseconds timeout);

    // Hands a decoded response to the waiting caller. Returns false when it was discarded.
    bool Deliver(JSONRPCResponse response);

    // Fails the in-flight exchange (if any) and every later Send() with err.
    void Close(const errors::ToolhostError& err);

    bool IsClosed() const;
    bool HasPending() const;

    // Next id that Send() will use.
    int64_t PeekNextId() const;

private:
    std::string name;
    FrameWriter writer;

    std::timed_mutex exchangeMutex;

    mutable std::mutex slotMutex;
    std::condition_variable slotCv;
    bool armed{false};
    std::string armedId;
    std::chrono::steady_clock::time_point armedAt;
    std::optional<JSONRPCResponse> delivered;
    std::optional<errors::ToolhostError> closedWith;
    int64_t nextId{1};
};

} // namespace toolhost
