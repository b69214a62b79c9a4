//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers and default client identity.
//==========================================================================================================
#include "toolhost/version.h"

#include <format>

namespace toolhost {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

Implementation getClientIdentity() {
    return Implementation("toolhost", getVersionString());
}

} // namespace toolhost
