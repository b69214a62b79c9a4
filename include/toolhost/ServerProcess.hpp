//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.hpp
// Purpose: One tool-server child process: spawn, handshake, tools/list, tools/call and stop.
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONValue.h"
#include "toolhost/Protocol.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

// Lifecycle of a connection. Starting -> Connected | Failed; Connected -> Stopped.
enum class ConnectionState {
    Starting,
    Connected,
    Failed,
    Stopped
};

const char* toString(ConnectionState state);

//==========================================================================================================
// ServerProcessOptions
// Purpose: Per-connection tunables.
// Fields:
//   spawnGrace: How long the child must survive after spawn before the handshake begins.
//   writeTimeout: Bound on writing one frame to the child's stdin.
//   clientInfo: Identity sent in the initialize request.
//   protocolVersion: Protocol revision sent in the initialize request.
//==========================================================================================================
struct ServerProcessOptions {
    std::chrono::milliseconds spawnGrace{1000};
    std::chrono::milliseconds writeTimeout{5000};
    Implementation clientInfo{getClientIdentity()};
    std::string protocolVersion{PROTOCOL_VERSION};
};

//==========================================================================================================
// ServerProcess
// Purpose: Owns one tool-server child end to end.
// Notes:
//   A dedicated reader thread decodes stdout lines: responses go to the request correlator,
//   notifications are logged and dropped, server-initiated requests are answered (ping, or
//   MethodNotFound), malformed lines are logged and skipped. A second thread drains stderr into the log.
//   Calls on one ServerProcess are serialized; different ServerProcess instances are independent.
//==========================================================================================================
class ServerProcess {
public:
    ServerProcess(std::string name,
                  std::string command,
                  std::vector<std::string> args = {},
                  std::map<std::string, std::string> env = {},
                  ServerProcessOptions options = {});
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    //======================================================================================================
    // Start
    // Purpose: Spawns the child, checks it survives the spawn grace period, starts the reader and the
    //          stderr drain, then performs the initialize / notifications/initialized handshake.
    // Args:
    //   timeout: Bound on the initialize round trip.
    // Returns:
    //   std::nullopt when Connected. SpawnFailed when the child could not start or exited during the
    //   grace period (message carries exit status and stderr). HandshakeFailed when the handshake did
    //   not complete; the child is killed. Start may be called once per instance.
    //======================================================================================================
    std::optional<errors::ToolhostError> Start(std::chrono::milliseconds timeout);

    //======================================================================================================
    // ListTools
    // Purpose: tools/list (following nextCursor pages within the same timeout).
    // Returns:
    //   Descriptors on success. On any failure the value is an empty list and error is set; the failure
    //   is logged and the connection is left as it was.
    //======================================================================================================
    Result<std::vector<ToolDescriptor>> ListTools(std::chrono::milliseconds timeout);

    //======================================================================================================
    // CallTool
    // Purpose: tools/call with {name, arguments}.
    // Returns:
    //   The "text" fields of result.content joined with '\n' (the serialized result when it has no
    //   text items). ToolError for a JSON-RPC error object or a result flagged isError. CallTimeout when
    //   the deadline passes; the connection stays usable. ProcessExited when the child died.
    //   ServerNotConnected when the connection is not Connected.
    //======================================================================================================
    Result<std::string> CallTool(const std::string& tool, const JSONValue& arguments, std::chrono::milliseconds timeout);

    //======================================================================================================
    // Stop
    // Purpose: Closes stdin, sends SIGTERM, waits up to timeout, then SIGKILL; joins the reader threads.
    // Notes:
    //   Idempotent: stopping a Stopped or Failed connection is a no-op. Stopping during Start kills the
    //   child so the pending handshake fails.
    //======================================================================================================
    std::optional<errors::ToolhostError> Stop(std::chrono::milliseconds timeout);

    ConnectionState State() const;
    const std::string& Name() const;

    // False once the child has gone away, even if Stop() has not been called yet.
    bool IsUsable() const;

    // serverInfo from the initialize result; empty before the handshake.
    Implementation ServerInfo() const;

    // Child pid, or -1 when no child was spawned.
    int Pid() const;

    // Number of stdout lines that could not be decoded.
    std::size_t MalformedFrameCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct ServerProcessTestHooks;
};

struct ServerProcessTestHooks {
    // Pushes one line through the stdout dispatch path as if the child had written it.
    static void feedStdoutLine(ServerProcess& p, const std::string& line);
};

} // namespace toolhost
