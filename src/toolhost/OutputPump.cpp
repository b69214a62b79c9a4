//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutputPump.cpp
// Purpose: poll()-driven line reader with an eventfd/self-pipe wakeup.
//==========================================================================================================

#include "toolhost/OutputPump.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#ifdef __linux__
#  include <sys/eventfd.h>
#endif

#include "logging/Logger.h"
#include "toolhost/FrameCodec.h"

namespace toolhost {

OutputPump::OutputPump() {
#ifdef __linux__
    wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd < 0) {
        LOG_ERROR("OutputPump: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
    }
#else
    if (::pipe(wakePipe) != 0) {
        LOG_ERROR("OutputPump: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
    } else {
        for (int fd : wakePipe) {
            int fl = ::fcntl(fd, F_GETFL, 0);
            if (fl >= 0) {
                (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
            }
            (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
    }
#endif
}

OutputPump::~OutputPump() {
    Stop();
#ifdef __linux__
    if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
#else
    if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
    if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
#endif
}

bool OutputPump::Start(int fd, LineHandler onLine, EofHandler onEof, std::size_t maxLineLength) {
    if (fd < 0 || running.load() || thread.joinable()) {
        return false;
    }
    lineHandler = std::move(onLine);
    eofHandler = std::move(onEof);
    stopRequested = false;
    running = true;
    thread = std::thread([this, fd, maxLineLength]() { run(fd, maxLineLength); });
    return true;
}

void OutputPump::Stop() {
    stopRequested = true;
    wake();
    if (thread.joinable()) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
    running = false;
}

void OutputPump::wake() {
#ifdef __linux__
    if (wakeEventFd >= 0) {
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("OutputPump: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }
#else
    if (wakePipe[1] >= 0) {
        char b = 'x';
        ssize_t wr;
        do {
            wr = ::write(wakePipe[1], &b, 1);
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("OutputPump: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }
#endif
}

void OutputPump::drainWake() {
#ifdef __linux__
    uint64_t v = 0;
    ssize_t r;
    do {
        r = ::read(wakeEventFd, &v, sizeof(v));
    } while (r < 0 && errno == EINTR);
#else
    std::array<char, 64> b{};
    ssize_t r;
    do {
        r = ::read(wakePipe[0], b.data(), b.size());
    } while (r > 0 || (r < 0 && errno == EINTR));
#endif
}

void OutputPump::run(int fd, std::size_t maxLineLength) {
    constexpr int waitTimeoutMs = 200;
    LineFramer framer(maxLineLength);
    std::string buffer;
    std::vector<char> tmp(4096);
#ifdef __linux__
    const int wfd = wakeEventFd;
#else
    const int wfd = wakePipe[0];
#endif
    bool reachedEof = false;

    while (!stopRequested.load()) {
        struct pollfd pfds[2];
        pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
        int nfds = 1;
        if (wfd >= 0) { pfds[1].fd = wfd; pfds[1].events = POLLIN; pfds[1].revents = 0; nfds = 2; }
        int rc = ::poll(pfds, static_cast<nfds_t>(nfds), waitTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("OutputPump: poll failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }
        if (nfds == 2 && (pfds[1].revents & POLLIN)) {
            drainWake();
            if (stopRequested.load()) {
                break;
            }
        }
        if (!(pfds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }
        ssize_t n = ::read(fd, tmp.data(), tmp.size());
        if (n > 0) {
            buffer.append(tmp.data(), static_cast<std::size_t>(n));
            while (auto line = framer.tryDecode(buffer)) {
                lineHandler(*line);
            }
        } else if (n == 0) {
            reachedEof = true;
            break;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_WARN("OutputPump: read error (errno={} msg={})", errno, ::strerror(errno));
            reachedEof = true;
            break;
        }
    }

    if (reachedEof) {
        while (!buffer.empty() && (buffer.back() == '\r' || buffer.back() == '\n')) {
            buffer.pop_back();
        }
        if (!buffer.empty() && buffer.size() <= maxLineLength) {
            lineHandler(buffer);
        }
        if (eofHandler && !stopRequested.load()) {
            eofHandler();
        }
    }
    running = false;
}

} // namespace toolhost
