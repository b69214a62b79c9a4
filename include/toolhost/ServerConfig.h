//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Declarative tool-server configuration ("mcpServers" JSON document).
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/BridgeProcess.hpp"
#include "toolhost/Protocol.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

struct ServerDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<BridgeDefinition> bridge;
    // When present, used in place of querying tools/list.
    std::optional<std::vector<ToolDescriptor>> tools;
};

struct ToolhostConfig {
    std::vector<ServerDefinition> servers;  // sorted by name
    bool found{false};
    std::string sourcePath;
};

//==========================================================================================================
// ParseConfig
// Purpose: Parses a configuration document.
// Shape:
//   { "mcpServers": { "<name>": { "command": "...", "args": [...], "env": {...},
//                                 "bridge": { "command": "...", "args": [...], "cwd": "..." },
//                                 "tools": [ { "name", "description", "inputSchema" } ] } } }
// Returns:
//   The parsed config (found = true), or ConfigParseError naming the offending server or field.
//   A document without "mcpServers" yields zero servers.
//==========================================================================================================
Result<ToolhostConfig> ParseConfig(const std::string& text, const std::string& sourcePath = "<memory>");

// Reads and parses path. A missing file yields an empty config with found = false.
Result<ToolhostConfig> LoadConfig(const std::string& path);

// $TOOLHOST_CONFIG, or "servers.json".
std::string DefaultConfigPath();

} // namespace toolhost
