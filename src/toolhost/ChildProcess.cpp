//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec with pipes, merged environment, bounded stdin writes and SIGTERM-then-SIGKILL stop.
//==========================================================================================================

#include "toolhost/ChildProcess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"

extern char** environ;

namespace toolhost {

namespace {

using errors::ErrorCode;

std::once_flag sigpipeOnce;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool makePipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    (void)::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    (void)::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Parent environment with overrides applied, as "KEY=VALUE" strings.
std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

void writeAllRaw(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        ssize_t w = ::write(fd, data, len);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return;
        data += w;
        len -= static_cast<std::size_t>(w);
    }
}

} // namespace

ChildProcess::~ChildProcess() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        running = pid > 0 && !reaped;
    }
    if (running) {
        Terminate(std::chrono::milliseconds(100));
    }
    {
        std::lock_guard<std::mutex> lk(stdinMutex);
        closeFd(stdinFd);
    }
    CloseOutputs();
}

std::optional<errors::ToolhostError> ChildProcess::Spawn(const ProcessSpec& spec) {
    FUNC_SCOPE();
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });

    if (spec.command.empty()) {
        return errors::makeError(ErrorCode::SpawnFailed, "empty command");
    }
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (pid > 0) {
            return errors::makeError(ErrorCode::SpawnFailed, "process already spawned");
        }
    }

    // Everything the child needs is prepared before fork; after fork only async-signal-safe calls run.
    std::vector<std::string> envStrings = mergedEnvironment(spec.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& s : envStrings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string commandCopy = spec.command;
    std::vector<std::string> argStrings = spec.args;
    std::vector<char*> argv;
    argv.reserve(argStrings.size() + 2);
    argv.push_back(commandCopy.data());
    for (auto& a : argStrings) argv.push_back(a.data());
    argv.push_back(nullptr);

    const std::string execFailMsg = "toolhost: failed to execute '" + spec.command + "'\n";
    const std::string chdirFailMsg = "toolhost: failed to change directory to '" + spec.cwd + "'\n";

    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    int errPipe[2]{-1, -1};
    int devNull = -1;
    auto closeAll = [&]() {
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(devNull);
    };

    if (!makePipe(errPipe)) {
        return errors::makeError(ErrorCode::SpawnFailed, std::string("pipe failed: ") + ::strerror(errno));
    }
    if (spec.pipeStdio) {
        if (!makePipe(inPipe) || !makePipe(outPipe)) {
            int err = errno;
            closeAll();
            return errors::makeError(ErrorCode::SpawnFailed, std::string("pipe failed: ") + ::strerror(err));
        }
    } else {
        devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devNull < 0) {
            int err = errno;
            closeAll();
            return errors::makeError(ErrorCode::SpawnFailed, std::string("open /dev/null failed: ") + ::strerror(err));
        }
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        closeAll();
        return errors::makeError(ErrorCode::SpawnFailed, std::string("fork failed: ") + ::strerror(err));
    }

    if (child == 0) {
        if (spec.newSession) {
            (void)::setsid();
        }
        if (spec.pipeStdio) {
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
        } else {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
        }
        ::dup2(errPipe[1], STDERR_FILENO);
        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
            writeAllRaw(STDERR_FILENO, chdirFailMsg.data(), chdirFailMsg.size());
            ::_exit(127);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        writeAllRaw(STDERR_FILENO, execFailMsg.data(), execFailMsg.size());
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(devNull);

    {
        std::lock_guard<std::mutex> lk(stateMutex);
        pid = child;
        reaped = false;
        groupLeader = spec.newSession;
        exitCode.reset();
    }
    {
        std::lock_guard<std::mutex> lk(stdinMutex);
        stdinFd = inPipe[1];
        if (stdinFd >= 0) {
            setNonBlocking(stdinFd);
        }
    }
    stdoutFd = outPipe[0];
    stderrFd = errPipe[0];
    LOG_DEBUG("Spawned '{}' pid={}", spec.command, static_cast<int>(child));
    return std::nullopt;
}

void ChildProcess::recordStatus(int status) {
    reaped = true;
    if (WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode = 128 + WTERMSIG(status);
    } else {
        exitCode = -1;
    }
}

bool ChildProcess::IsAlive() {
    std::lock_guard<std::mutex> lk(stateMutex);
    if (pid <= 0 || reaped) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pid) {
        recordStatus(status);
        return false;
    }
    if (errno == ECHILD) {
        reaped = true;
        exitCode = -1;
        return false;
    }
    return true;
}

bool ChildProcess::WaitExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (IsAlive()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void ChildProcess::signalChild(int sig) {
    std::lock_guard<std::mutex> lk(stateMutex);
    if (pid <= 0 || reaped) {
        return;
    }
    if (groupLeader) {
        if (::kill(-pid, sig) == 0) {
            return;
        }
    }
    if (::kill(pid, sig) != 0 && errno != ESRCH) {
        LOG_WARN("kill(pid={}, sig={}) failed (errno={} msg={})", static_cast<int>(pid), sig, errno, ::strerror(errno));
    }
}

bool ChildProcess::Terminate(std::chrono::milliseconds grace) {
    if (!IsAlive()) {
        return true;
    }
    signalChild(SIGTERM);
    if (WaitExit(grace)) {
        return true;
    }
    LOG_WARN("pid={} ignored SIGTERM for {} ms; sending SIGKILL", static_cast<int>(Pid()), static_cast<long long>(grace.count()));
    signalChild(SIGKILL);
    std::lock_guard<std::mutex> lk(stateMutex);
    if (pid > 0 && !reaped) {
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            recordStatus(status);
        } else {
            reaped = true;
            exitCode = -1;
        }
    }
    return false;
}

std::optional<int> ChildProcess::ExitCode() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    return exitCode;
}

pid_t ChildProcess::Pid() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    return pid;
}

std::optional<errors::ToolhostError> ChildProcess::WriteStdin(const std::string& data, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(stdinMutex);
    if (stdinFd < 0) {
        return errors::makeError(ErrorCode::ProcessExited, "stdin is closed");
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t total = 0;
    while (total < data.size()) {
        ssize_t w = ::write(stdinFd, data.data() + total, data.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                if (total == 0) {
                    return errors::makeError(ErrorCode::RequestTimeout, "timed out writing to stdin");
                }
                // A torn frame would corrupt every later one; give up on the stream instead
                LOG_WARN("Child stalled after {} of {} bytes; closing stdin", total, data.size());
                closeFd(stdinFd);
                return errors::makeError(ErrorCode::ProcessExited,
                    std::format("stdin closed after a partial write ({} of {} bytes)", total, data.size()));
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            struct pollfd pfd{};
            pfd.fd = stdinFd;
            pfd.events = POLLOUT;
            (void)::poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count() + 1, 100)));
            continue;
        }
        if (w < 0 && errno == EPIPE) {
            return errors::makeError(ErrorCode::ProcessExited, "stdin pipe closed by child");
        }
        return errors::makeError(ErrorCode::ProcessExited, std::string("write failed: ") + ::strerror(errno));
    }
    return std::nullopt;
}

void ChildProcess::CloseStdin() {
    std::lock_guard<std::mutex> lk(stdinMutex);
    closeFd(stdinFd);
}

std::string ChildProcess::ReadAvailableStderr(std::size_t maxBytes) {
    std::string out;
    if (stderrFd < 0) {
        return out;
    }
    setNonBlocking(stderrFd);
    char buf[4096];
    while (out.size() < maxBytes) {
        ssize_t n = ::read(stderrFd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    if (out.size() > maxBytes) {
        out.resize(maxBytes);
    }
    return out;
}

void ChildProcess::CloseOutputs() {
    closeFd(stdoutFd);
    closeFd(stderrFd);
}

} // namespace toolhost
