//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Tool catalog refresh and lookup.
//==========================================================================================================

#include "toolhost/ToolCatalog.h"

#include <mutex>

#include "logging/Logger.h"
#include "toolhost/ServerProcess.hpp"

namespace toolhost {

std::size_t ToolCatalog::Refresh(const std::vector<std::shared_ptr<ServerProcess>>& connections,
                                 const std::map<std::string, std::vector<ToolDescriptor>>& staticTools,
                                 std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    // Listing happens outside the lock; readers see the old catalog until the swap.
    std::map<std::string, std::vector<ToolDescriptor>> next;
    for (const auto& conn : connections) {
        if (!conn || conn->State() != ConnectionState::Connected) {
            continue;
        }
        const std::string& server = conn->Name();
        if (auto it = staticTools.find(server); it != staticTools.end()) {
            LOG_DEBUG("[{}] using {} configured tools", server, it->second.size());
            next[server] = it->second;
            continue;
        }
        auto listed = conn->ListTools(timeout);
        if (!listed.ok()) {
            LOG_WARN("[{}] no tools registered: {}", server, listed.error->message);
            continue;
        }
        next[server] = std::move(listed.value);
    }

    std::size_t count = 0;
    for (const auto& [server, tools] : next) {
        count += tools.size();
    }
    {
        std::unique_lock<std::shared_mutex> lk(mutex);
        byServer = std::move(next);
    }
    LOG_INFO("Tool catalog refreshed: {} tools from {} servers", count, connections.size());
    return count;
}

void ToolCatalog::SetServerTools(const std::string& server, std::vector<ToolDescriptor> tools) {
    std::unique_lock<std::shared_mutex> lk(mutex);
    byServer[server] = std::move(tools);
}

std::vector<ToolDescriptor> ToolCatalog::Tools() const {
    std::shared_lock<std::shared_mutex> lk(mutex);
    std::vector<ToolDescriptor> out;
    for (const auto& [server, tools] : byServer) {
        out.insert(out.end(), tools.begin(), tools.end());
    }
    return out;
}

std::vector<ToolDescriptor> ToolCatalog::ToolsFor(const std::string& server) const {
    std::shared_lock<std::shared_mutex> lk(mutex);
    auto it = byServer.find(server);
    if (it == byServer.end()) {
        return {};
    }
    return it->second;
}

std::optional<ToolDescriptor> ToolCatalog::Find(const std::string& qualifiedName) const {
    std::shared_lock<std::shared_mutex> lk(mutex);
    for (const auto& [server, tools] : byServer) {
        for (const auto& t : tools) {
            if (t.QualifiedName() == qualifiedName) {
                return t;
            }
        }
    }
    return std::nullopt;
}

void ToolCatalog::Remove(const std::string& server) {
    std::unique_lock<std::shared_mutex> lk(mutex);
    byServer.erase(server);
}

void ToolCatalog::Clear() {
    std::unique_lock<std::shared_mutex> lk(mutex);
    byServer.clear();
}

std::size_t ToolCatalog::Size() const {
    std::shared_lock<std::shared_mutex> lk(mutex);
    std::size_t count = 0;
    for (const auto& [server, tools] : byServer) {
        count += tools.size();
    }
    return count;
}

} // namespace toolhost
