//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration file loading and validation.
//==========================================================================================================

#include "toolhost/ServerConfig.h"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolhost {

using errors::ErrorCode;

namespace {

errors::ToolhostError configError(const std::string& source, const std::string& what) {
    return errors::makeError(ErrorCode::ConfigParseError, std::format("{}: {}", source, what));
}

// Reads an optional array of strings. Returns false when present but not an array of strings.
bool readStringList(const JSONValue& object, const std::string& key, std::vector<std::string>& out) {
    const JSONValue* member = FindMember(object, key);
    if (!member || member->IsNull()) {
        return true;
    }
    const auto* arr = std::get_if<JSONValue::Array>(&member->value);
    if (!arr) {
        return false;
    }
    for (const auto& item : *arr) {
        const auto* s = item ? std::get_if<std::string>(&item->value) : nullptr;
        if (!s) {
            return false;
        }
        out.push_back(*s);
    }
    return true;
}

std::optional<errors::ToolhostError> parseServer(const std::string& source, const std::string& name,
                                                 const JSONValue& entry, ServerDefinition& def) {
    if (!entry.IsObject()) {
        return configError(source, std::format("server '{}' is not an object", name));
    }
    def.name = name;
    auto command = GetString(entry, "command");
    if (!command.has_value() || command->empty()) {
        return configError(source, std::format("server '{}' has no command", name));
    }
    def.command = command.value();
    if (!readStringList(entry, "args", def.args)) {
        return configError(source, std::format("server '{}': args must be an array of strings", name));
    }

    if (const JSONValue* env = FindMember(entry, "env"); env && !env->IsNull()) {
        const auto* obj = std::get_if<JSONValue::Object>(&env->value);
        if (!obj) {
            return configError(source, std::format("server '{}': env must be an object", name));
        }
        for (const auto& [key, val] : *obj) {
            const auto* s = val ? std::get_if<std::string>(&val->value) : nullptr;
            if (!s) {
                return configError(source, std::format("server '{}': env value '{}' is not a string", name, key));
            }
            def.env[key] = *s;
        }
    }

    if (const JSONValue* bridge = FindMember(entry, "bridge"); bridge && !bridge->IsNull()) {
        if (!bridge->IsObject()) {
            return configError(source, std::format("server '{}': bridge must be an object", name));
        }
        BridgeDefinition b;
        auto bcmd = GetString(*bridge, "command");
        if (!bcmd.has_value() || bcmd->empty()) {
            return configError(source, std::format("server '{}': bridge has no command", name));
        }
        b.command = bcmd.value();
        if (!readStringList(*bridge, "args", b.args)) {
            return configError(source, std::format("server '{}': bridge args must be an array of strings", name));
        }
        b.cwd = GetString(*bridge, "cwd").value_or("");
        def.bridge = std::move(b);
    }

    if (const JSONValue* tools = FindMember(entry, "tools"); tools && !tools->IsNull()) {
        const auto* arr = std::get_if<JSONValue::Array>(&tools->value);
        if (!arr) {
            return configError(source, std::format("server '{}': tools must be an array", name));
        }
        std::vector<ToolDescriptor> list;
        for (const auto& item : *arr) {
            auto d = item ? ToolDescriptorFromJSON(name, *item) : std::nullopt;
            if (!d.has_value()) {
                return configError(source, std::format("server '{}': tool entry needs a name", name));
            }
            list.push_back(std::move(d.value()));
        }
        def.tools = std::move(list);
    }
    return std::nullopt;
}

} // namespace

Result<ToolhostConfig> ParseConfig(const std::string& text, const std::string& sourcePath) {
    using R = Result<ToolhostConfig>;
    std::string parseError;
    auto doc = ParseJSON(text, &parseError);
    if (!doc.has_value()) {
        return R::Failure(configError(sourcePath, "invalid JSON: " + parseError));
    }
    if (!doc->IsObject()) {
        return R::Failure(configError(sourcePath, "root is not an object"));
    }

    ToolhostConfig cfg;
    cfg.found = true;
    cfg.sourcePath = sourcePath;

    const JSONValue* servers = FindMember(doc.value(), "mcpServers");
    if (!servers || servers->IsNull()) {
        LOG_INFO("{}: no mcpServers section", sourcePath);
        return R::Success(std::move(cfg));
    }
    const auto* obj = std::get_if<JSONValue::Object>(&servers->value);
    if (!obj) {
        return R::Failure(configError(sourcePath, "mcpServers is not an object"));
    }
    for (const auto& [name, entry] : *obj) {
        ServerDefinition def;
        if (!entry) {
            return R::Failure(configError(sourcePath, std::format("server '{}' is not an object", name)));
        }
        if (auto err = parseServer(sourcePath, name, *entry, def)) {
            return R::Failure(err.value());
        }
        cfg.servers.push_back(std::move(def));
    }
    std::sort(cfg.servers.begin(), cfg.servers.end(),
              [](const ServerDefinition& a, const ServerDefinition& b) { return a.name < b.name; });
    LOG_DEBUG("{}: {} server(s) configured", sourcePath, cfg.servers.size());
    return R::Success(std::move(cfg));
}

Result<ToolhostConfig> LoadConfig(const std::string& path) {
    FUNC_SCOPE();
    using R = Result<ToolhostConfig>;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_INFO("Config file {} not found; no tool servers configured", path);
        ToolhostConfig cfg;
        cfg.sourcePath = path;
        return R::Success(std::move(cfg));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::Failure(configError(path, "cannot be read"));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto result = ParseConfig(ss.str(), path);
    if (!result.ok()) {
        LOG_ERROR("{}", result.error->message);
    }
    return result;
}

std::string DefaultConfigPath() {
    return GetEnvOrDefault("TOOLHOST_CONFIG", "servers.json");
}

} // namespace toolhost
