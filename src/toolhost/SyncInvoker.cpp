//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SyncInvoker.cpp
// Purpose: Thread-to-context bridge for blocking tool calls.
//==========================================================================================================

#include "toolhost/SyncInvoker.hpp"

#include <exception>
#include <format>
#include <future>
#include <memory>

#include <boost/asio/co_spawn.hpp>

#include "logging/Logger.h"
#include "toolhost/ServerManager.hpp"

namespace toolhost {
namespace net = boost::asio;

SyncInvoker::SyncInvoker(ServerManager& manager, std::size_t fallbackThreads)
    : manager(manager), fallback(fallbackThreads) {}

SyncInvoker::~SyncInvoker() {
    fallback.join();
}

Result<std::string> SyncInvoker::CallSync(const std::string& qualifiedName, const JSONValue& arguments,
                                          std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    auto slot = std::make_shared<std::promise<Result<std::string>>>();
    auto fut = slot->get_future();

    auto handler = [slot, qualifiedName](std::exception_ptr eptr, Result<std::string> result) {
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                LOG_ERROR("{} raised: {}", qualifiedName, e.what());
                result = Result<std::string>::Failure(errors::makeError(errors::ErrorCode::ToolError, e.what()));
            }
        }
        slot->set_value(std::move(result));
    };
    // The same deadline bounds the exchange itself, so an abandoned call releases the connection
    if (manager.RunningInPool()) {
        net::co_spawn(fallback, manager.CoCallTool(qualifiedName, arguments, timeout), std::move(handler));
    } else {
        net::co_spawn(manager.Pool(), manager.CoCallTool(qualifiedName, arguments, timeout), std::move(handler));
    }

    if (fut.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("{} did not complete within {} ms", qualifiedName, static_cast<long long>(timeout.count()));
        return Result<std::string>::Failure(errors::makeError(
            errors::ErrorCode::CallTimeout,
            std::format("{} timed out after {} ms", qualifiedName, static_cast<long long>(timeout.count()))));
    }
    return fut.get();
}

Result<std::string> SyncInvoker::CallSync(const std::string& qualifiedName, const JSONValue& arguments) {
    return CallSync(qualifiedName, arguments, manager.Options().callTimeout);
}

std::string SyncInvoker::CallForText(const std::string& qualifiedName, const JSONValue& arguments) {
    auto result = CallSync(qualifiedName, arguments);
    if (!result.ok()) {
        return errors::toUserText(result.error.value());
    }
    return result.value;
}

} // namespace toolhost
