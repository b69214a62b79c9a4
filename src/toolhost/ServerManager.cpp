//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.cpp
// Purpose: Connection registry, bridge startup, concurrent connect and call routing.
//==========================================================================================================

#include "toolhost/ServerManager.hpp"

#include <exception>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/BridgeProcess.hpp"
#include "toolhost/ServerProcess.hpp"
#include "toolhost/ToolCatalog.h"
#include "toolhost/async/BlockingAwaitable.h"

namespace toolhost {
namespace net = boost::asio;

using errors::ErrorCode;

namespace {

void readDurationEnv(const char* name, std::chrono::milliseconds& field) {
    bool malformed = false;
    auto v = ParseEnvInteger(name, &malformed);
    if (malformed) {
        LOG_WARN("Ignoring malformed {}='{}'", name, GetEnvOrDefault(name, ""));
        return;
    }
    if (v.has_value()) {
        field = std::chrono::milliseconds(v.value());
    }
}

Result<std::string> notConnected(const std::string& qualifiedName) {
    LOG_WARN("No connected server provides {}", qualifiedName);
    return Result<std::string>::Failure(errors::makeError(
        ErrorCode::ServerNotConnected, std::format("no connected server provides {}", qualifiedName)));
}

} // namespace

ManagerOptions ManagerOptions::FromEnvironment() {
    ManagerOptions o;
    readDurationEnv("TOOLHOST_HANDSHAKE_TIMEOUT_MS", o.handshakeTimeout);
    readDurationEnv("TOOLHOST_LIST_TIMEOUT_MS", o.listTimeout);
    readDurationEnv("TOOLHOST_CALL_TIMEOUT_MS", o.callTimeout);
    readDurationEnv("TOOLHOST_STOP_TIMEOUT_MS", o.stopTimeout);
    readDurationEnv("TOOLHOST_SPAWN_GRACE_MS", o.spawnGrace);
    readDurationEnv("TOOLHOST_BRIDGE_SETTLE_MS", o.bridgeSettle);

    bool malformed = false;
    auto threads = ParseEnvInteger("TOOLHOST_WORKER_THREADS", &malformed);
    if (malformed || (threads.has_value() && threads.value() == 0)) {
        LOG_WARN("Ignoring malformed TOOLHOST_WORKER_THREADS='{}'", GetEnvOrDefault("TOOLHOST_WORKER_THREADS", ""));
    } else if (threads.has_value()) {
        o.workerThreads = static_cast<std::size_t>(threads.value());
    }
    return o;
}

class ServerManager::Impl {
public:
    ManagerOptions options;
    net::thread_pool pool;
    ToolCatalog catalog;

    mutable std::shared_mutex connectionsMutex;
    std::map<std::string, std::shared_ptr<ServerProcess>> connections;
    std::map<std::string, std::vector<ToolDescriptor>> staticTools;

    std::mutex bridgesMutex;
    std::map<std::string, std::unique_ptr<BridgeProcess>> bridges;

    explicit Impl(ManagerOptions o)
        : options(std::move(o)), pool(options.workerThreads) {}

    bool inPool() {
        return pool.get_executor().running_in_this_thread();
    }

    // Launches the server's bridge unless it is already running. Failure is logged and ignored.
    void startBridge(const ServerDefinition& def) {
        if (!def.bridge.has_value()) {
            return;
        }
        std::lock_guard<std::mutex> lk(bridgesMutex);
        auto& slot = bridges[def.name];
        if (!slot) {
            slot = std::make_unique<BridgeProcess>(def.name, def.bridge.value());
        }
        if (slot->IsRunning()) {
            LOG_INFO("[{}] bridge already running", def.name);
            return;
        }
        if (auto err = slot->Start(options.bridgeSettle)) {
            LOG_WARN("[{}] continuing without bridge: {}", def.name, err->message);
        }
    }

    std::shared_ptr<ServerProcess> find(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lk(connectionsMutex);
        auto it = connections.find(name);
        return it == connections.end() ? nullptr : it->second;
    }

    std::optional<errors::ToolhostError> connectServer(const ServerDefinition& def) {
        if (auto existing = find(def.name); existing && existing->IsUsable()) {
            LOG_DEBUG("[{}] already connected", def.name);
            return std::nullopt;
        }
        ServerProcessOptions spo;
        spo.spawnGrace = options.spawnGrace;
        auto conn = std::make_shared<ServerProcess>(def.name, def.command, def.args, def.env, spo);
        if (auto err = conn->Start(options.handshakeTimeout)) {
            LOG_ERROR("[{}] not connected: {}", def.name, err->message);
            return err;
        }
        std::shared_ptr<ServerProcess> replaced;
        {
            std::unique_lock<std::shared_mutex> lk(connectionsMutex);
            auto& slot = connections[def.name];
            replaced = std::move(slot);
            slot = conn;
            if (def.tools.has_value()) {
                staticTools[def.name] = def.tools.value();
            } else {
                staticTools.erase(def.name);
            }
        }
        if (replaced) {
            (void)replaced->Stop(options.stopTimeout);
        }
        return std::nullopt;
    }

    // The handshake blocks for up to the handshake timeout; keep it off the pool threads
    net::awaitable<std::optional<errors::ToolhostError>> coConnect(ServerDefinition def) {
        co_return co_await async::RunBlocking<std::optional<errors::ToolhostError>>(
            [this, def = std::move(def)]() { return connectServer(def); });
    }

    void refreshServer(const std::string& name) {
        std::shared_ptr<ServerProcess> conn;
        std::optional<std::vector<ToolDescriptor>> configured;
        {
            std::shared_lock<std::shared_mutex> lk(connectionsMutex);
            auto it = connections.find(name);
            if (it == connections.end()) {
                return;
            }
            conn = it->second;
            if (auto st = staticTools.find(name); st != staticTools.end()) {
                configured = st->second;
            }
        }
        if (configured.has_value()) {
            catalog.SetServerTools(name, std::move(configured.value()));
            return;
        }
        auto listed = conn->ListTools(options.listTimeout);
        if (!listed.ok()) {
            LOG_WARN("[{}] no tools registered: {}", name, listed.error->message);
        }
        catalog.SetServerTools(name, std::move(listed.value));
    }

    std::size_t refreshAll() {
        std::vector<std::shared_ptr<ServerProcess>> snapshot;
        std::map<std::string, std::vector<ToolDescriptor>> configured;
        {
            std::shared_lock<std::shared_mutex> lk(connectionsMutex);
            for (const auto& [name, conn] : connections) {
                snapshot.push_back(conn);
            }
            configured = staticTools;
        }
        return catalog.Refresh(snapshot, configured, options.listTimeout);
    }

    // Resolves mcp_<server>_<tool> to a connection and a plain tool name.
    std::shared_ptr<ServerProcess> resolve(const std::string& qualifiedName, std::string& tool) const {
        std::shared_lock<std::shared_mutex> lk(connectionsMutex);
        std::shared_ptr<ServerProcess> best;
        std::size_t bestLen = 0;
        for (const auto& [name, conn] : connections) {
            const std::string prefix = std::string(QUALIFIED_TOOL_PREFIX) + NormalizeServerName(name) + "_";
            if (qualifiedName.size() > prefix.size() && qualifiedName.compare(0, prefix.size(), prefix) == 0
                && prefix.size() > bestLen) {
                best = conn;
                bestLen = prefix.size();
            }
        }
        if (best) {
            tool = qualifiedName.substr(bestLen);
        }
        return best;
    }

    void stopAll() {
        std::map<std::string, std::shared_ptr<ServerProcess>> drained;
        {
            std::unique_lock<std::shared_mutex> lk(connectionsMutex);
            drained.swap(connections);
            staticTools.clear();
        }
        catalog.Clear();

        const bool sequential = inPool();
        std::vector<std::future<void>> pending;
        for (auto& [name, conn] : drained) {
            auto stopOne = [this, name = name, conn = conn]() {
                if (auto err = conn->Stop(options.stopTimeout)) {
                    LOG_WARN("[{}] stop failed: {}", name, err->message);
                }
            };
            if (sequential) {
                stopOne();
                continue;
            }
            auto task = std::make_shared<std::packaged_task<void()>>(std::move(stopOne));
            pending.push_back(task->get_future());
            net::post(pool, [task]() { (*task)(); });
        }
        for (auto& f : pending) {
            try {
                f.get();
            } catch (const std::exception& e) {
                LOG_WARN("Server stop raised: {}", e.what());
            }
        }

        std::lock_guard<std::mutex> lk(bridgesMutex);
        for (auto& [name, bridge] : bridges) {
            if (bridge) {
                bridge->Stop(options.stopTimeout);
            }
        }
        bridges.clear();
    }
};

ServerManager::ServerManager(ManagerOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {}

ServerManager::~ServerManager() {
    if (pImpl) {
        DisconnectAll();
        pImpl->pool.join();
    }
}

Result<ToolhostConfig> ServerManager::LoadConfig(const std::string& path) const {
    return toolhost::LoadConfig(path);
}

Result<std::size_t> ServerManager::ConnectAll(const ToolhostConfig& config) {
    FUNC_SCOPE();
    for (const auto& def : config.servers) {
        pImpl->startBridge(def);
    }

    std::size_t connected = 0;
    if (pImpl->inPool()) {
        // Waiting on our own pool from one of its threads could starve it; connect inline instead
        for (const auto& def : config.servers) {
            if (!pImpl->connectServer(def)) {
                ++connected;
            }
        }
    } else {
        std::vector<std::future<bool>> pending;
        for (const auto& def : config.servers) {
            std::promise<bool> done;
            pending.push_back(done.get_future());
            net::co_spawn(pImpl->pool, pImpl->coConnect(def),
                [pr = std::move(done), name = def.name](std::exception_ptr eptr,
                                                        std::optional<errors::ToolhostError> err) mutable {
                    bool ok = !err.has_value();
                    if (eptr) {
                        ok = false;
                        try {
                            std::rethrow_exception(eptr);
                        } catch (const std::exception& e) {
                            LOG_ERROR("[{}] connect raised: {}", name, e.what());
                        }
                    }
                    pr.set_value(ok);
                });
        }
        for (auto& f : pending) {
            if (f.get()) {
                ++connected;
            }
        }
    }

    LOG_INFO("Connected {}/{} tool servers", connected, config.servers.size());
    pImpl->refreshAll();
    return Result<std::size_t>::Success(connected);
}

std::optional<errors::ToolhostError> ServerManager::Connect(const ServerDefinition& definition) {
    FUNC_SCOPE();
    pImpl->startBridge(definition);
    if (auto err = pImpl->connectServer(definition)) {
        return err;
    }
    pImpl->refreshServer(definition.name);
    return std::nullopt;
}

Result<std::string> ServerManager::CallTool(const std::string& qualifiedName, const JSONValue& arguments) {
    FUNC_SCOPE();
    std::string tool;
    auto conn = pImpl->resolve(qualifiedName, tool);
    if (!conn) {
        return notConnected(qualifiedName);
    }
    return conn->CallTool(tool, arguments, pImpl->options.callTimeout);
}

Result<std::string> ServerManager::CallServerTool(const std::string& server, const std::string& tool,
                                                  const JSONValue& arguments) {
    auto conn = pImpl->find(server);
    if (!conn) {
        return Result<std::string>::Failure(errors::makeError(
            ErrorCode::ServerNotConnected, std::format("server '{}' is not connected", server)));
    }
    return conn->CallTool(tool, arguments, pImpl->options.callTimeout);
}

net::awaitable<Result<std::string>> ServerManager::CoCallTool(std::string qualifiedName, JSONValue arguments) {
    return CoCallTool(std::move(qualifiedName), std::move(arguments), pImpl->options.callTimeout);
}

net::awaitable<Result<std::string>> ServerManager::CoCallTool(std::string qualifiedName, JSONValue arguments,
                                                              std::chrono::milliseconds timeout) {
    std::string tool;
    auto conn = pImpl->resolve(qualifiedName, tool);
    if (!conn) {
        co_return notConnected(qualifiedName);
    }
    co_return co_await async::RunBlocking<Result<std::string>>(
        [conn, tool = std::move(tool), arguments = std::move(arguments), timeout]() {
            return conn->CallTool(tool, arguments, timeout);
        });
}

std::vector<ToolDescriptor> ServerManager::ListAllTools() const {
    return pImpl->catalog.Tools();
}

std::vector<ToolDescriptor> ServerManager::ListTools(const std::string& server) const {
    return pImpl->catalog.ToolsFor(server);
}

std::size_t ServerManager::RefreshTools() {
    return pImpl->refreshAll();
}

std::vector<std::string> ServerManager::ConnectedServers() const {
    std::shared_lock<std::shared_mutex> lk(pImpl->connectionsMutex);
    std::vector<std::string> names;
    for (const auto& [name, conn] : pImpl->connections) {
        if (conn->IsUsable()) {
            names.push_back(name);
        }
    }
    return names;
}

std::optional<errors::ToolhostError> ServerManager::Disconnect(const std::string& name) {
    FUNC_SCOPE();
    std::shared_ptr<ServerProcess> conn;
    {
        std::unique_lock<std::shared_mutex> lk(pImpl->connectionsMutex);
        auto it = pImpl->connections.find(name);
        if (it == pImpl->connections.end()) {
            return errors::makeError(ErrorCode::ServerNotConnected, std::format("server '{}' is not connected", name));
        }
        conn = std::move(it->second);
        pImpl->connections.erase(it);
        pImpl->staticTools.erase(name);
    }
    pImpl->catalog.Remove(name);
    return conn->Stop(pImpl->options.stopTimeout);
}

void ServerManager::DisconnectAll() {
    FUNC_SCOPE();
    pImpl->stopAll();
}

net::thread_pool& ServerManager::Pool() {
    return pImpl->pool;
}

bool ServerManager::RunningInPool() const {
    return pImpl->inPool();
}

const ManagerOptions& ServerManager::Options() const {
    return pImpl->options;
}

} // namespace toolhost
