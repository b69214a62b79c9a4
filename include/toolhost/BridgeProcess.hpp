//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeProcess.hpp
// Purpose: Auxiliary long-running process launched before a tool server that depends on it.
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/ChildProcess.hpp"
#include "toolhost/OutputPump.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

struct BridgeDefinition {
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
};

//==========================================================================================================
// BridgeProcess
// Purpose: Runs a bridge in its own session so it outlives a misbehaving tool server and can be torn
//          down as a group. Bridge stdout is discarded; stderr goes to the log at debug level.
//==========================================================================================================
class BridgeProcess {
public:
    BridgeProcess(std::string serverName, BridgeDefinition definition);
    ~BridgeProcess();

    BridgeProcess(const BridgeProcess&) = delete;
    BridgeProcess& operator=(const BridgeProcess&) = delete;

    //======================================================================================================
    // Start
    // Purpose: Launches the bridge unless it is already running, then waits settle for it to come up.
    // Returns:
    //   std::nullopt when the bridge is running (or already was). SpawnFailed when it could not be
    //   launched or died during the settle period. Callers treat the failure as non-fatal.
    //======================================================================================================
    std::optional<errors::ToolhostError> Start(std::chrono::milliseconds settle);

    bool IsRunning();

    // SIGTERM to the bridge's process group, SIGKILL after grace.
    void Stop(std::chrono::milliseconds grace);

    int Pid() const;

private:
    std::string serverName;
    BridgeDefinition definition;
    std::unique_ptr<ChildProcess> child;
    OutputPump stderrPump;
};

} // namespace toolhost
