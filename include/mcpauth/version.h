//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the mcpauth library (reported as software_version during registration).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpauth {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

} // namespace mcpauth
