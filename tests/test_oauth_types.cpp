//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_oauth_types.cpp
// Purpose: Client metadata validation, registration/token/metadata parsing and the provider state graph
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "mcpauth/Json.h"
#include "mcpauth/auth/OAuthTypes.hpp"
#include "mcpauth/errors/Errors.h"
#include "mcpauth/version.h"

using namespace mcpauth;
using namespace mcpauth::auth;

namespace {

ClientMetadata validMetadata() {
    ClientMetadata m;
    m.redirectUris = {"http://localhost:3030/callback"};
    return m;
}

} // namespace

TEST(ClientMetadata, DefaultsAreValid) {
    EXPECT_NO_THROW(validMetadata().validate());
}

TEST(ClientMetadata, ValidationFailures) {
    ClientMetadata noRedirect;
    EXPECT_THROW(noRedirect.validate(), errors::ConfigurationError);

    ClientMetadata relative = validMetadata();
    relative.redirectUris = {"/callback"};
    EXPECT_THROW(relative.validate(), errors::ConfigurationError);

    ClientMetadata noCode = validMetadata();
    noCode.responseTypes = {"token"};
    EXPECT_THROW(noCode.validate(), errors::ConfigurationError);

    ClientMetadata badGrant = validMetadata();
    badGrant.grantTypes = {"password"};
    EXPECT_THROW(badGrant.validate(), errors::ConfigurationError);

    ClientMetadata badMethod = validMetadata();
    badMethod.tokenEndpointAuthMethod = "private_key_jwt";
    EXPECT_THROW(badMethod.validate(), errors::ConfigurationError);
}

TEST(ClientMetadata, RegistrationJson) {
    ClientMetadata m = validMetadata();
    m.clientName = "cli";
    m.scope = "files:read";
    JSONValue v = parseJson(m.toRegistrationJson());
    ASSERT_TRUE(v.isObject());
    const auto& o = std::get<JSONValue::Object>(v.value);
    EXPECT_EQ(jsonGetString(o, "client_name").value_or(""), "cli");
    EXPECT_EQ(jsonGetString(o, "scope").value_or(""), "files:read");
    EXPECT_EQ(jsonGetString(o, "token_endpoint_auth_method").value_or(""), "client_secret_post");
    auto redirects = jsonGetStringArray(o, "redirect_uris");
    ASSERT_TRUE(redirects.has_value());
    EXPECT_EQ(redirects->at(0), "http://localhost:3030/callback");
    EXPECT_EQ(jsonGetStringArray(o, "grant_types")->size(), 2u);
    EXPECT_FALSE(jsonGetString(o, "logo_uri").has_value());
    EXPECT_EQ(jsonGetString(o, "software_version").value_or(""), getVersionString());
}

TEST(ClientCredentials, FromRegistrationResponse) {
    auto c = ClientCredentials::fromRegistrationResponse(
        R"({"client_id":"abc","client_secret":"s3","client_id_issued_at":1700000000,"client_secret_expires_at":0,
            "redirect_uris":["http://localhost:3030/callback"],"token_endpoint_auth_method":"client_secret_basic"})");
    EXPECT_EQ(c.clientId, "abc");
    EXPECT_EQ(c.clientSecret.value_or(""), "s3");
    EXPECT_EQ(c.clientIdIssuedAt.value_or(0), 1700000000);
    EXPECT_EQ(c.tokenEndpointAuthMethod, "client_secret_basic");
    EXPECT_EQ(c.redirectUris.size(), 1u);

    auto publicClient = ClientCredentials::fromRegistrationResponse(R"({"client_id":"pub"})");
    EXPECT_FALSE(publicClient.clientSecret.has_value());

    EXPECT_THROW(ClientCredentials::fromRegistrationResponse(R"({"client_secret":"x"})"), errors::ConfigurationError);
    EXPECT_THROW(ClientCredentials::fromRegistrationResponse("not json"), errors::ConfigurationError);
}

TEST(TokenSet, ParseAndExpiry) {
    const auto issued = std::chrono::system_clock::now();
    auto t = TokenSet::fromTokenResponse(
        R"({"access_token":"tok1","token_type":"Bearer","expires_in":3600,"refresh_token":"r1","scope":"a b"})", issued);
    EXPECT_EQ(t.accessToken, "tok1");
    EXPECT_EQ(t.refreshToken.value_or(""), "r1");
    EXPECT_EQ(t.scope.value_or(""), "a b");
    ASSERT_TRUE(t.expiresAt().has_value());
    EXPECT_EQ(*t.expiresAt(), issued + std::chrono::seconds(3600));

    EXPECT_FALSE(t.isExpired(issued, std::chrono::seconds(60)));
    EXPECT_FALSE(t.isExpired(issued + std::chrono::seconds(3539), std::chrono::seconds(60)));
    EXPECT_TRUE(t.isExpired(issued + std::chrono::seconds(3540), std::chrono::seconds(60)));
    EXPECT_TRUE(t.isExpired(issued + std::chrono::seconds(3600), std::chrono::seconds(0)));
}

TEST(TokenSet, NoLifetimeNeverExpires) {
    auto t = TokenSet::fromTokenResponse(R"({"access_token":"forever"})", std::chrono::system_clock::now());
    EXPECT_FALSE(t.expiresAt().has_value());
    EXPECT_FALSE(t.isExpired(std::chrono::system_clock::now() + std::chrono::hours(24 * 365), std::chrono::seconds(60)));
    EXPECT_EQ(t.tokenType, "Bearer");
}

TEST(TokenSet, RejectsUnusableDocuments) {
    const auto now = std::chrono::system_clock::now();
    try {
        TokenSet::fromTokenResponse(R"({"token_type":"Bearer"})", now);
        FAIL() << "expected ServerError";
    } catch (const errors::ServerError& e) {
        EXPECT_EQ(e.errorCode(), "invalid_token_response");
        EXPECT_EQ(e.httpStatus(), 200);
    }
    EXPECT_THROW(TokenSet::fromTokenResponse("<html>", now), errors::ServerError);
}

TEST(ServerMetadata, ParsesRequiredEndpoints) {
    auto m = AuthorizationServerMetadata::fromJson(
        R"({"issuer":"https://as","authorization_endpoint":"https://as/authorize","token_endpoint":"https://as/token",
            "registration_endpoint":"https://as/register","code_challenge_methods_supported":["S256"],"scopes_supported":["a"]})");
    EXPECT_EQ(m.issuer, "https://as");
    EXPECT_EQ(m.authorizationEndpoint, "https://as/authorize");
    EXPECT_EQ(m.registrationEndpoint.value_or(""), "https://as/register");
    EXPECT_EQ(m.codeChallengeMethodsSupported.size(), 1u);

    EXPECT_THROW(AuthorizationServerMetadata::fromJson(R"({"issuer":"https://as","token_endpoint":"https://as/token"})"),
                 errors::ConfigurationError);

    auto prm = ProtectedResourceMetadata::fromJson(R"({"resource":"https://mcp/mcp","authorization_servers":["https://as"]})");
    ASSERT_EQ(prm.authorizationServers.size(), 1u);
    EXPECT_EQ(prm.authorizationServers[0], "https://as");
}

TEST(ProviderStateGraph, LegalAndIllegalEdges) {
    EXPECT_TRUE(isLegalTransition(ProviderState::Unregistered, ProviderState::Registered));
    EXPECT_TRUE(isLegalTransition(ProviderState::Registered, ProviderState::AwaitingAuthorization));
    EXPECT_TRUE(isLegalTransition(ProviderState::AwaitingAuthorization, ProviderState::Exchanging));
    EXPECT_TRUE(isLegalTransition(ProviderState::Exchanging, ProviderState::Authorized));
    EXPECT_TRUE(isLegalTransition(ProviderState::Authorized, ProviderState::Refreshing));
    EXPECT_TRUE(isLegalTransition(ProviderState::Refreshing, ProviderState::AwaitingAuthorization));
    EXPECT_TRUE(isLegalTransition(ProviderState::Exchanging, ProviderState::Failed));

    EXPECT_FALSE(isLegalTransition(ProviderState::Unregistered, ProviderState::Exchanging));
    EXPECT_FALSE(isLegalTransition(ProviderState::AwaitingAuthorization, ProviderState::Authorized));
    EXPECT_FALSE(isLegalTransition(ProviderState::Failed, ProviderState::Unregistered));
    EXPECT_FALSE(isLegalTransition(ProviderState::Failed, ProviderState::Failed));

    EXPECT_STREQ(providerStateToString(ProviderState::AwaitingAuthorization), "AwaitingAuthorization");
}
