//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Library version and the client identity announced to tool providers
//==========================================================================================================
#include "mcplink/version.h"

namespace mcplink {

namespace {
constexpr VersionInfo kVersion{0, 3, 0};
constexpr const char* kClientName = "mcplink";
} // namespace

VersionInfo getVersion() { return kVersion; }

std::string getVersionString() {
    return std::to_string(kVersion.major) + "." + std::to_string(kVersion.minor) + "." +
           std::to_string(kVersion.patch);
}

Implementation clientImplementation() { return Implementation(kClientName, getVersionString()); }

} // namespace mcplink
