//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Exchange lock, single pending slot, id check on delivery and deadline handling.
//==========================================================================================================

#include "toolhost/RequestCorrelator.h"

#include <format>
#include <variant>

#include "logging/Logger.h"
#include "toolhost/FrameCodec.h"

namespace toolhost {

using errors::ErrorCode;

RequestCorrelator::RequestCorrelator(std::string connectionName, FrameWriter writer)
    : name(std::move(connectionName)), writer(std::move(writer)) {}

Result<JSONRPCResponse> RequestCorrelator::Send(const std::string& method, std::optional<JSONValue> params,
                                                std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::timed_mutex> exchange(exchangeMutex, std::defer_lock);
    if (!exchange.try_lock_until(deadline)) {
        return Result<JSONRPCResponse>::Failure(errors::makeError(ErrorCode::RequestTimeout,
            std::format("[{}] {} timed out waiting for the previous request", name, method)));
    }

    JSONRPCRequest request;
    request.method = method;
    request.params = std::move(params);
    {
        std::lock_guard<std::mutex> lk(slotMutex);
        if (closedWith.has_value()) {
            return Result<JSONRPCResponse>::Failure(closedWith.value());
        }
        request.id = nextId++;
        armed = true;
        armedId = IdToString(request.id);
        armedAt = std::chrono::steady_clock::now();
        delivered.reset();
    }

    auto writeErr = writer(FrameCodec::Encode(request));
    if (writeErr.has_value()) {
        std::lock_guard<std::mutex> lk(slotMutex);
        armed = false;
        return Result<JSONRPCResponse>::Failure(writeErr.value());
    }

    std::unique_lock<std::mutex> lk(slotMutex);
    slotCv.wait_until(lk, deadline, [this]() {
        return delivered.has_value() || closedWith.has_value();
    });
    armed = false;
    if (delivered.has_value()) {
        JSONRPCResponse response = std::move(delivered.value());
        delivered.reset();
        LOG_DEBUG("[{}] {} id={} answered in {} ms", name, method, armedId,
                  std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - armedAt).count());
        return Result<JSONRPCResponse>::Success(std::move(response));
    }
    if (closedWith.has_value()) {
        return Result<JSONRPCResponse>::Failure(closedWith.value());
    }
    LOG_WARN("[{}] {} id={} timed out after {} ms", name, method, armedId, static_cast<long long>(timeout.count()));
    return Result<JSONRPCResponse>::Failure(errors::makeError(ErrorCode::RequestTimeout,
        std::format("[{}] no response to {} within {} ms", name, method, static_cast<long long>(timeout.count()))));
}

bool RequestCorrelator::Deliver(JSONRPCResponse response) {
    const std::string id = IdToString(response.id);
    // A peer that could not read the request id answers with "id": null; with one exchange in
    // flight that error can only belong to it
    const bool unaddressedError = std::holds_alternative<std::nullptr_t>(response.id) && response.IsError();
    {
        std::lock_guard<std::mutex> lk(slotMutex);
        if (!armed || (id != armedId && !unaddressedError) || delivered.has_value()) {
            LOG_DEBUG("[{}] discarding response id={} (pending={})", name, id, armed ? armedId : std::string("none"));
            return false;
        }
        delivered = std::move(response);
    }
    slotCv.notify_all();
    return true;
}

void RequestCorrelator::Close(const errors::ToolhostError& err) {
    {
        std::lock_guard<std::mutex> lk(slotMutex);
        if (!closedWith.has_value()) {
            closedWith = err;
        }
    }
    slotCv.notify_all();
}

bool RequestCorrelator::IsClosed() const {
    std::lock_guard<std::mutex> lk(slotMutex);
    return closedWith.has_value();
}

bool RequestCorrelator::HasPending() const {
    std::lock_guard<std::mutex> lk(slotMutex);
    return armed;
}

int64_t RequestCorrelator::PeekNextId() const {
    std::lock_guard<std::mutex> lk(slotMutex);
    return nextId;
}

} // namespace toolhost
