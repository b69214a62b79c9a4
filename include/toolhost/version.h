//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the client identity announced to tool servers.
//==========================================================================================================
#pragma once

#include <string>

#include "toolhost/Protocol.h"

namespace toolhost {

// Semantic version components.
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// clientInfo sent in every initialize request: {"toolhost", getVersionString()}.
Implementation getClientIdentity();

} // namespace toolhost
