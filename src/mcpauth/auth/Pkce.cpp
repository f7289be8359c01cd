//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/Pkce.cpp
// Purpose: PKCE and state generation on top of OpenSSL RAND/SHA256/EVP base64
//==========================================================================================================

#include <stdexcept>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include "mcpauth/auth/Pkce.hpp"

namespace mcpauth::auth {

namespace {
constexpr std::size_t kVerifierBytes = 48;
constexpr std::size_t kStateBytes = 32;
} // namespace

std::string base64Encode(const std::string& data) {
    if (data.empty()) return std::string();
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::string base64UrlEncode(const unsigned char* data, std::size_t len) {
    std::string b64 = base64Encode(std::string(reinterpret_cast<const char*>(data), len));
    std::string out;
    out.reserve(b64.size());
    for (char c : b64) {
        if (c == '+') out.push_back('-');
        else if (c == '/') out.push_back('_');
        else if (c == '=') break;
        else out.push_back(c);
    }
    return out;
}

std::string randomUrlSafeToken(std::size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (::RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce random data");
    }
    return base64UrlEncode(buf.data(), buf.size());
}

std::string generateCodeVerifier() {
    return randomUrlSafeToken(kVerifierBytes);
}

std::string deriveCodeChallenge(const std::string& verifier) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    ::SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), digest);
    return base64UrlEncode(digest, sizeof(digest));
}

std::string generateState() {
    return randomUrlSafeToken(kStateBytes);
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace mcpauth::auth
