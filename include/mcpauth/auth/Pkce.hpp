//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/Pkce.hpp
// Purpose: PKCE (RFC 7636) verifier/challenge and anti-forgery state generation
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

namespace mcpauth::auth {

// Unpadded base64url encoding.
std::string base64UrlEncode(const unsigned char* data, std::size_t len);

// Standard padded base64 (used for HTTP Basic credentials).
std::string base64Encode(const std::string& data);

// base64url of `bytes` bytes from the OpenSSL CSPRNG. Throws std::runtime_error if the RNG fails.
std::string randomUrlSafeToken(std::size_t bytes);

// 64-character code verifier (48 random bytes), within the 43..128 range mandated by RFC 7636.
std::string generateCodeVerifier();

// S256 challenge: base64url(SHA-256(verifier)) without padding.
std::string deriveCodeChallenge(const std::string& verifier);

// Opaque anti-forgery state value (32 random bytes).
std::string generateState();

// Length-independent comparison for secrets such as the state parameter.
bool constantTimeEquals(const std::string& a, const std::string& b);

} // namespace mcpauth::auth
