//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolhost command line: connect configured tool servers, list tools, optionally call one
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/ServerManager.hpp"
#include "toolhost/SyncInvoker.hpp"
#include "toolhost/version.h"
#include <iostream>
#include <optional>
#include <string>

using namespace toolhost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "usage: toolhost_cli [--config=PATH] [--call=mcp_<server>_<tool>] [--args=JSON] [--version]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();

    if (hasFlag(argc, argv, "--help")) {
        printUsage();
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << getVersionString() << "\n";
        return 0;
    }

    const std::string configPath = getArgValue(argc, argv, "--config").value_or(DefaultConfigPath());
    ServerManager manager;

    auto config = manager.LoadConfig(configPath);
    if (!config.ok()) {
        std::cerr << errors::toUserText(config.error.value()) << ": " << config.error->message << "\n";
        return 2;
    }

    auto connected = manager.ConnectAll(config.value);
    LOG_INFO("{} of {} configured servers connected", connected.value, config.value.servers.size());

    auto call = getArgValue(argc, argv, "--call");
    if (!call.has_value()) {
        for (const auto& tool : manager.ListAllTools()) {
            std::cout << tool.QualifiedName() << "\t" << tool.description << "\n";
        }
        manager.DisconnectAll();
        return 0;
    }

    JSONValue arguments{JSONValue::Object{}};
    if (auto raw = getArgValue(argc, argv, "--args")) {
        std::string parseError;
        auto parsed = ParseJSON(raw.value(), &parseError);
        if (!parsed.has_value() || !parsed->IsObject()) {
            std::cerr << "--args must be a JSON object" << (parseError.empty() ? "" : ": ") << parseError << "\n";
            manager.DisconnectAll();
            return 2;
        }
        arguments = std::move(parsed.value());
    }

    SyncInvoker invoker(manager);
    auto result = invoker.CallSync(call.value(), arguments);
    int rc = 0;
    if (result.ok()) {
        std::cout << result.value << "\n";
    } else {
        std::cout << errors::toUserText(result.error.value()) << "\n";
        rc = 1;
    }
    manager.DisconnectAll();
    return rc;
}
