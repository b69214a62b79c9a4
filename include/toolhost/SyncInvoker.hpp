//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SyncInvoker.hpp
// Purpose: Blocking tool calls for threads outside the core execution context.
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "toolhost/JSONValue.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

class ServerManager;

//==========================================================================================================
// SyncInvoker
// Purpose: Schedules ServerManager::CoCallTool on the manager's pool and blocks the caller on the result.
// Notes:
//   When the caller is itself a pool thread the call runs on this invoker's own worker pool, so the
//   waiting thread never holds up the work it waits for. The deadline is also the exchange timeout,
//   so a call that misses it returns CallTimeout and frees the connection for the next request.
//   The invoker must not outlive its manager.
//==========================================================================================================
class SyncInvoker {
public:
    explicit SyncInvoker(ServerManager& manager, std::size_t fallbackThreads = 2);
    ~SyncInvoker();

    SyncInvoker(const SyncInvoker&) = delete;
    SyncInvoker& operator=(const SyncInvoker&) = delete;

    Result<std::string> CallSync(const std::string& qualifiedName, const JSONValue& arguments,
                                 std::chrono::milliseconds timeout);

    // Uses the manager's call timeout.
    Result<std::string> CallSync(const std::string& qualifiedName, const JSONValue& arguments);

    // Result text, or the short user-facing error text ("Error: ...").
    std::string CallForText(const std::string& qualifiedName, const JSONValue& arguments);

private:
    ServerManager& manager;
    boost::asio::thread_pool fallback;
};

} // namespace toolhost
