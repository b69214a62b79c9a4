//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeProcess.cpp
// Purpose: Bridge process launch, liveness and teardown.
//==========================================================================================================

#include "toolhost/BridgeProcess.hpp"

#include <format>
#include <utility>

#include "logging/Logger.h"

namespace toolhost {

BridgeProcess::BridgeProcess(std::string serverName, BridgeDefinition definition)
    : serverName(std::move(serverName)), definition(std::move(definition)) {}

BridgeProcess::~BridgeProcess() {
    Stop(std::chrono::milliseconds(1000));
}

std::optional<errors::ToolhostError> BridgeProcess::Start(std::chrono::milliseconds settle) {
    FUNC_SCOPE();
    if (child && child->IsAlive()) {
        LOG_DEBUG("[{}] bridge already running (pid {})", serverName, static_cast<int>(child->Pid()));
        return std::nullopt;
    }
    if (child) {
        // Previous instance died; release its pipes before relaunching
        stderrPump.Stop();
        child.reset();
    }

    ProcessSpec spec;
    spec.command = definition.command;
    spec.args = definition.args;
    spec.cwd = definition.cwd;
    spec.newSession = true;
    spec.pipeStdio = false;

    LOG_INFO("[{}] starting bridge: {}", serverName, definition.command);
    auto next = std::make_unique<ChildProcess>();
    if (auto err = next->Spawn(spec)) {
        LOG_WARN("[{}] bridge spawn failed: {}", serverName, err->message);
        return errors::makeError(errors::ErrorCode::SpawnFailed,
                                 std::format("[{}] bridge: {}", serverName, err->message));
    }
    child = std::move(next);
    const std::string tag = serverName;
    stderrPump.Start(child->StderrFd(), [tag](const std::string& line) {
        LOG_DEBUG("[{}] bridge stderr: {}", tag, line);
    });

    if (child->WaitExit(settle)) {
        const int status = child->ExitCode().value_or(-1);
        LOG_WARN("[{}] bridge exited during settle with status {}", serverName, status);
        return errors::makeError(errors::ErrorCode::SpawnFailed,
                                 std::format("[{}] bridge exited with status {}", serverName, status));
    }
    LOG_INFO("[{}] bridge running (pid {})", serverName, static_cast<int>(child->Pid()));
    return std::nullopt;
}

bool BridgeProcess::IsRunning() {
    return child && child->IsAlive();
}

void BridgeProcess::Stop(std::chrono::milliseconds grace) {
    if (!child) {
        return;
    }
    if (child->IsAlive()) {
        LOG_INFO("[{}] stopping bridge", serverName);
        if (!child->Terminate(grace)) {
            LOG_WARN("[{}] bridge killed after {} ms", serverName, static_cast<long long>(grace.count()));
        }
    }
    stderrPump.Stop();
    child->CloseOutputs();
    child.reset();
}

int BridgeProcess::Pid() const {
    return child ? static_cast<int>(child->Pid()) : -1;
}

} // namespace toolhost
