//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_www_authenticate.cpp
// Purpose: Unit tests for the WWW-Authenticate Bearer challenge parser
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpauth/auth/WwwAuthenticate.hpp"

using namespace mcpauth::auth;

TEST(WwwAuthenticate, ParseBearerWithResourceMetadataAndScope) {
    const std::string h =
        "Bearer resource_metadata=\"https://mcp.example.com/.well-known/oauth-protected-resource\", scope=\"files:read files:write\"";
    auto c = parseBearerChallenge(h);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->resourceMetadata, std::string("https://mcp.example.com/.well-known/oauth-protected-resource"));
    EXPECT_EQ(c->scope, std::string("files:read files:write"));
    EXPECT_EQ(c->params.size(), 2u);
}

TEST(WwwAuthenticate, ParseBearerWithoutParams) {
    auto c = parseBearerChallenge("Bearer");
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->params.empty());
    EXPECT_TRUE(c->error.empty());
}

TEST(WwwAuthenticate, RejectNonBearerScheme) {
    EXPECT_FALSE(parseBearerChallenge("Basic realm=\"X\"").has_value());
    EXPECT_FALSE(parseBearerChallenge("").has_value());
}

TEST(WwwAuthenticate, HandleQuotedEscapes) {
    const std::string h = R"(Bearer error="insufficient_scope", error_description="need \"files:write\"")";
    auto c = parseBearerChallenge(h);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->error, std::string("insufficient_scope"));
    EXPECT_EQ(c->errorDescription, std::string("need \"files:write\""));
}

TEST(WwwAuthenticate, BearerAfterAnotherChallenge) {
    auto c = parseBearerChallenge(R"(Basic realm="legacy", Bearer realm="mcp", error=invalid_token)");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->realm, "mcp");
    EXPECT_EQ(c->error, "invalid_token");
}

TEST(WwwAuthenticate, CaseInsensitiveSchemeAndKeys) {
    auto c = parseBearerChallenge(R"(bearer Scope="a", ERROR="invalid_token")");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scope, "a");
    EXPECT_EQ(c->error, "invalid_token");
}

TEST(WwwAuthenticate, UnterminatedQuoteIsMalformed) {
    EXPECT_FALSE(parseBearerChallenge(R"(Bearer scope="open)").has_value());
}
