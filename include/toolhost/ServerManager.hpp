//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.hpp
// Purpose: Owns every tool-server connection, their bridges and the tool catalog; routes calls.
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include "toolhost/JSONValue.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

//==========================================================================================================
// ManagerOptions
// Purpose: Timeouts and pool sizing for a ServerManager.
// Environment overrides (FromEnvironment): TOOLHOST_HANDSHAKE_TIMEOUT_MS, TOOLHOST_LIST_TIMEOUT_MS,
//   TOOLHOST_CALL_TIMEOUT_MS, TOOLHOST_STOP_TIMEOUT_MS, TOOLHOST_SPAWN_GRACE_MS,
//   TOOLHOST_BRIDGE_SETTLE_MS, TOOLHOST_WORKER_THREADS. Malformed values are logged and ignored.
//==========================================================================================================
struct ManagerOptions {
    std::chrono::milliseconds handshakeTimeout{30000};
    std::chrono::milliseconds listTimeout{5000};
    std::chrono::milliseconds callTimeout{1200000};
    std::chrono::milliseconds stopTimeout{5000};
    std::chrono::milliseconds spawnGrace{1000};
    std::chrono::milliseconds bridgeSettle{3000};
    std::size_t workerThreads{4};

    static ManagerOptions FromEnvironment();
};

//==========================================================================================================
// ServerManager
// Purpose: Explicitly constructed owner of all connections. Its Boost.Asio thread pool is the core
//          execution context on which connects fan out and coroutine calls run.
// Notes:
//   Connections are keyed by server name and guarded by a reader/writer lock. Calls to one server are
//   serialized by that connection; calls to different servers run in parallel.
//==========================================================================================================
class ServerManager {
public:
    explicit ServerManager(ManagerOptions options = ManagerOptions::FromEnvironment());
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // Reads a configuration file (see ServerConfig.h).
    Result<ToolhostConfig> LoadConfig(const std::string& path) const;

    //======================================================================================================
    // ConnectAll
    // Purpose: Starts configured bridges, then starts every server concurrently and refreshes the
    //          tool catalog.
    // Returns:
    //   Number of servers that reached Connected. Individual failures are logged and do not make the
    //   result an error.
    //======================================================================================================
    Result<std::size_t> ConnectAll(const ToolhostConfig& config);

    // Starts one server (and its bridge). No-op when a server of that name is already connected.
    std::optional<errors::ToolhostError> Connect(const ServerDefinition& definition);

    //======================================================================================================
    // CallTool
    // Purpose: Resolves mcp_<server>_<tool> against the connected servers (longest matching server
    //          prefix wins) and invokes the tool with the call timeout.
    // Returns:
    //   Result text, or ServerNotConnected when no connected server matches, or the call's error.
    //======================================================================================================
    Result<std::string> CallTool(const std::string& qualifiedName, const JSONValue& arguments);

    // Invokes a tool by server name and plain tool name.
    Result<std::string> CallServerTool(const std::string& server, const std::string& tool, const JSONValue& arguments);

    //======================================================================================================
    // CoCallTool
    // Purpose: CallTool for coroutines running on the core execution context. The exchange with the
    //          server runs on its own thread, so a slow server never holds a pool thread.
    // Args:
    //   timeout: Bound on the exchange; the call timeout when omitted.
    //======================================================================================================
    boost::asio::awaitable<Result<std::string>> CoCallTool(std::string qualifiedName, JSONValue arguments);
    boost::asio::awaitable<Result<std::string>> CoCallTool(std::string qualifiedName, JSONValue arguments,
                                                           std::chrono::milliseconds timeout);

    std::vector<ToolDescriptor> ListAllTools() const;
    std::vector<ToolDescriptor> ListTools(const std::string& server) const;

    // Re-queries every connected server. Returns the new tool count.
    std::size_t RefreshTools();

    // Names of servers that are connected and whose process is still alive, sorted.
    std::vector<std::string> ConnectedServers() const;

    // Stops one server and drops its tools. ServerNotConnected when the name is unknown.
    std::optional<errors::ToolhostError> Disconnect(const std::string& name);

    // Stops every server and bridge. Failures are logged, not propagated.
    void DisconnectAll();

    boost::asio::thread_pool& Pool();

    // True when the calling thread belongs to the core execution context.
    bool RunningInPool() const;

    const ManagerOptions& Options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
