//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Aggregated, qualified view of the tools offered by every connected server.
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {

class ServerProcess;

class ToolCatalog {
public:
    //======================================================================================================
    // Refresh
    // Purpose: Rebuilds the catalog. Servers with an entry in staticTools use that list; the others are
    //          asked via tools/list. A server whose listing fails contributes no tools.
    // Returns:
    //   Number of tools in the new catalog.
    //======================================================================================================
    std::size_t Refresh(const std::vector<std::shared_ptr<ServerProcess>>& connections,
                        const std::map<std::string, std::vector<ToolDescriptor>>& staticTools,
                        std::chrono::milliseconds timeout);

    // Replaces the tools of one server without touching the others.
    void SetServerTools(const std::string& server, std::vector<ToolDescriptor> tools);

    // All tools, ordered by server then by listing order.
    std::vector<ToolDescriptor> Tools() const;
    std::vector<ToolDescriptor> ToolsFor(const std::string& server) const;

    // Lookup by mcp_<server>_<tool>.
    std::optional<ToolDescriptor> Find(const std::string& qualifiedName) const;

    void Remove(const std::string& server);
    void Clear();
    std::size_t Size() const;

private:
    mutable std::shared_mutex mutex;
    std::map<std::string, std::vector<ToolDescriptor>> byServer;
};

} // namespace toolhost
