//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-server protocol constants, identities and tool descriptors.
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolhost/JSONValue.h"

namespace toolhost {

// Protocol revision announced in the initialize request.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Prefix of every qualified tool name.
constexpr const char* QUALIFIED_TOOL_PREFIX = "mcp_";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Name/version pair exchanged in the handshake (clientInfo / serverInfo).
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// ToolDescriptor
// Purpose: One tool offered by one server.
// Fields:
//   server: Owning server name as configured.
//   name: Tool name as reported by the server.
//   description: Human-readable description.
//   inputSchema: JSON Schema document for the arguments object.
//==========================================================================================================
struct ToolDescriptor {
    std::string server;
    std::string name;
    std::string description;
    JSONValue inputSchema{JSONValue::Object{}};

    // mcp_<normalized server>_<tool>
    std::string QualifiedName() const;
};

// Replaces separators ('-', '.', ' ') in a server name with '_'.
std::string NormalizeServerName(const std::string& server);

// QUALIFIED_TOOL_PREFIX + NormalizeServerName(server) + "_" + tool
std::string QualifiedToolName(const std::string& server, const std::string& tool);

//==========================================================================================================
// ToolDescriptorFromJSON
// Purpose: Reads one entry of a tools/list result (or of a configured static tool list).
// Returns:
//   std::nullopt when the entry is not an object or has no non-empty string "name".
//   description defaults to the tool name; inputSchema defaults to {}.
//==========================================================================================================
std::optional<ToolDescriptor> ToolDescriptorFromJSON(const std::string& server, const JSONValue& entry);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";
}

} // namespace toolhost
