//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers.
//==========================================================================================================
#include "mcpauth/version.h"

#include <fmt/format.h>

namespace mcpauth {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpauth
