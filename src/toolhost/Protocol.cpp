//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Qualified tool naming and tool descriptor parsing.
//==========================================================================================================

#include "toolhost/Protocol.h"

namespace toolhost {

std::string NormalizeServerName(const std::string& server) {
    std::string out = server;
    for (char& c : out) {
        if (c == '-' || c == '.' || c == ' ') {
            c = '_';
        }
    }
    return out;
}

std::string QualifiedToolName(const std::string& server, const std::string& tool) {
    return std::string(QUALIFIED_TOOL_PREFIX) + NormalizeServerName(server) + "_" + tool;
}

std::string ToolDescriptor::QualifiedName() const {
    return QualifiedToolName(server, name);
}

std::optional<ToolDescriptor> ToolDescriptorFromJSON(const std::string& server, const JSONValue& entry) {
    auto name = GetString(entry, "name");
    if (!name.has_value() || name->empty()) {
        return std::nullopt;
    }
    ToolDescriptor d;
    d.server = server;
    d.name = name.value();
    d.description = GetString(entry, "description").value_or(d.name);
    if (const JSONValue* schema = FindMember(entry, "inputSchema"); schema && schema->IsObject()) {
        d.inputSchema = *schema;
    }
    return d;
}

} // namespace toolhost
