//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: POSIX child process with separate stdin/stdout/stderr pipes and graceful-then-forceful stop.
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "toolhost/errors/Errors.h"

namespace toolhost {

//==========================================================================================================
// ProcessSpec
// Purpose: What to launch and how.
// Fields:
//   command: Program name or path; resolved through PATH like a shell would.
//   args: Arguments after argv[0].
//   env: Variables merged over the parent environment (overrides win).
//   cwd: Working directory for the child; empty keeps the parent's.
//   newSession: Start the child in its own session/process group; Terminate then signals the group.
//   pipeStdio: When false, stdin/stdout are attached to /dev/null instead of pipes. stderr is always piped.
//==========================================================================================================
struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;
    bool newSession{false};
    bool pipeStdio{true};
};

//==========================================================================================================
// ChildProcess
// Purpose: Owns one forked child and the parent ends of its pipes.
// Notes:
//   SIGPIPE is ignored process-wide on first spawn so writes to a dead child fail with EPIPE.
//   Pipe ends are close-on-exec so concurrently spawned children never inherit each other's pipes.
//   The destructor kills a still-running child and reaps it.
//==========================================================================================================
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    //======================================================================================================
    // Spawn
    // Purpose: fork/exec the child described by spec.
    // Returns:
    //   std::nullopt on success; SpawnFailed when pipes or fork fail. An exec failure (e.g. unknown
    //   command) surfaces as the child exiting with status 127 and a message on its stderr.
    //======================================================================================================
    std::optional<errors::ToolhostError> Spawn(const ProcessSpec& spec);

    // Non-blocking liveness check; reaps the child when it has exited.
    bool IsAlive();

    // Polls for exit up to timeout. Returns true when the child is gone.
    bool WaitExit(std::chrono::milliseconds timeout);

    //======================================================================================================
    // Terminate
    // Purpose: SIGTERM, wait up to grace, then SIGKILL and reap.
    // Returns:
    //   true when the child exited within the grace period (or was already gone).
    //======================================================================================================
    bool Terminate(std::chrono::milliseconds grace);

    // Exit code once reaped; 128 + signal number when killed by a signal.
    std::optional<int> ExitCode() const;

    pid_t Pid() const;
    int StdoutFd() const { return stdoutFd; }
    int StderrFd() const { return stderrFd; }

    //======================================================================================================
    // WriteStdin
    // Purpose: Writes all of data to the child's stdin, waiting at most timeout for pipe space.
    // Returns:
    //   std::nullopt on success; ProcessExited when the pipe is closed or broken; RequestTimeout when
    //   the child stops reading before any byte was written. A stall after a partial write closes
    //   stdin and returns ProcessExited, since the stream can no longer carry whole frames.
    //======================================================================================================
    std::optional<errors::ToolhostError> WriteStdin(const std::string& data, std::chrono::milliseconds timeout);

    // Closes the parent's write end so the child sees EOF on stdin.
    void CloseStdin();

    // Reads whatever stderr holds right now without blocking (used after an early exit).
    std::string ReadAvailableStderr(std::size_t maxBytes = 64 * 1024);

    // Closes the remaining parent pipe ends. Readers of StdoutFd/StderrFd must have stopped.
    void CloseOutputs();

private:
    void recordStatus(int status);
    void signalChild(int sig);

    mutable std::mutex stateMutex;
    pid_t pid{-1};
    bool reaped{false};
    bool groupLeader{false};
    std::optional<int> exitCode;

    std::mutex stdinMutex;
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
};

} // namespace toolhost
