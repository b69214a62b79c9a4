//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutputPump.hpp
// Purpose: Background thread that splits a child's output stream into lines and hands them to a callback.
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace toolhost {

//==========================================================================================================
// OutputPump
// Purpose: Reads one file descriptor until EOF or Stop(), delivering complete lines in order.
// Notes:
//   The reader waits with poll() on the stream and a wake signal (eventfd on Linux, self-pipe elsewhere)
//   so Stop() never has to wait for the child to write or exit.
//   A partial last line is delivered at EOF. onEof runs once on the pump thread when the stream ends
//   by itself (not when stopped).
//==========================================================================================================
class OutputPump {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using EofHandler = std::function<void()>;

    OutputPump();
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    // Starts the pump thread. Returns false when already running or fd is invalid.
    bool Start(int fd, LineHandler onLine, EofHandler onEof = nullptr, std::size_t maxLineLength = 4 * 1024 * 1024);

    // Wakes and joins the pump thread. Safe to call repeatedly and from the pump's own callbacks.
    void Stop();

    bool IsRunning() const { return running.load(); }

private:
    void run(int fd, std::size_t maxLineLength);
    void wake();
    void drainWake();

    std::thread thread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    LineHandler lineHandler;
    EofHandler eofHandler;
#ifdef __linux__
    int wakeEventFd{-1};
#else
    int wakePipe[2]{-1, -1};
#endif
};

} // namespace toolhost
