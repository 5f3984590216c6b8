//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the client identity announced to tool providers
//==========================================================================================================
#pragma once

#include <string>

#include "mcplink/Protocol.h"

namespace mcplink {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

//==========================================================================================================
// clientImplementation
// Purpose: clientInfo sent in initialize when the embedder does not override it.
// Returns:
//   {"mcplink", getVersionString()}
//==========================================================================================================
Implementation clientImplementation();

} // namespace mcplink
