//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_pkce.cpp
// Purpose: PKCE verifier/challenge derivation, state generation and encoding helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "mcpauth/auth/Pkce.hpp"

using namespace mcpauth::auth;

namespace {

bool isUrlSafe(const std::string& s) {
    for (char c : s) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // namespace

// RFC 7636 Appendix B.
TEST(Pkce, ChallengeMatchesRfcVector) {
    EXPECT_EQ(deriveCodeChallenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
              std::string("E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM"));
}

TEST(Pkce, VerifierShapeAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        std::string v = generateCodeVerifier();
        EXPECT_GE(v.size(), 43u);
        EXPECT_LE(v.size(), 128u);
        EXPECT_TRUE(isUrlSafe(v)) << v;
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(Pkce, StateIsUnpredictableAndUrlSafe) {
    std::string a = generateState();
    std::string b = generateState();
    EXPECT_NE(a, b);
    EXPECT_GE(a.size(), 43u);
    EXPECT_TRUE(isUrlSafe(a));
}

TEST(Pkce, Base64Variants) {
    const std::string data = "\xfb\xff";
    EXPECT_EQ(base64UrlEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size()), "-_8");
    EXPECT_EQ(base64Encode("client-1:secret-1"), "Y2xpZW50LTE6c2VjcmV0LTE=");
    EXPECT_EQ(base64Encode(""), "");
}

TEST(Pkce, ConstantTimeEquals) {
    EXPECT_TRUE(constantTimeEquals("abc", "abc"));
    EXPECT_FALSE(constantTimeEquals("abc", "abd"));
    EXPECT_FALSE(constantTimeEquals("abc", "abcd"));
    EXPECT_TRUE(constantTimeEquals("", ""));
}

TEST(Pkce, RandomTokenLength) {
    EXPECT_EQ(randomUrlSafeToken(3).size(), 4u);
    EXPECT_EQ(randomUrlSafeToken(48).size(), 64u);
}
