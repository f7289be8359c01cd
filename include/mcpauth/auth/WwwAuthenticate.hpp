//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges (RFC 6750/RFC 9728 parameters)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace mcpauth::auth {

//==========================================================================================================
// BearerChallenge
// Purpose: Bearer challenge carried by a 401/403 response from a protected resource.
// Fields:
//   resourceMetadata: RFC 9728 protected resource metadata URL (drives re-discovery).
//   scope: Scope the resource requires (drives the next authorization request).
//   params: Every parameter, keys lower-cased, values unquoted and unescaped.
//==========================================================================================================
struct BearerChallenge {
    std::string realm;
    std::string error;
    std::string errorDescription;
    std::string scope;
    std::string resourceMetadata;
    std::unordered_map<std::string, std::string> params;
};

//==========================================================================================================
// parseBearerChallenge
// Purpose: Locate and parse the Bearer challenge in a WWW-Authenticate header value.
// Notes:
//   - The header may list several challenges ("Basic realm=x, Bearer scope=y"); only Bearer is returned.
//   - Returns std::nullopt when no Bearer challenge is present or its parameters are malformed.
//==========================================================================================================
std::optional<BearerChallenge> parseBearerChallenge(const std::string& header);

} // namespace mcpauth::auth
