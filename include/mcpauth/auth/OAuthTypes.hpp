//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/OAuthTypes.hpp
// Purpose: OAuth 2.0 client data model: client metadata, issued credentials, token sets, attempts, states
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpauth::auth {

//==========================================================================================================
// ClientMetadata
// Purpose: Descriptor submitted to the authorization server during dynamic client registration (RFC 7591).
// Fields:
//   redirectUris: At least one absolute http(s) URI; the first one is used for authorization requests.
//   grantTypes: Subset of {authorization_code, refresh_token}.
//   responseTypes: Must contain "code".
//   tokenEndpointAuthMethod: none | client_secret_post | client_secret_basic.
//==========================================================================================================
struct ClientMetadata {
    std::string clientName{"mcpauth client"};
    std::vector<std::string> redirectUris;
    std::vector<std::string> grantTypes{"authorization_code", "refresh_token"};
    std::vector<std::string> responseTypes{"code"};
    std::string tokenEndpointAuthMethod{"client_secret_post"};
    std::string scope;
    std::string clientUri;
    std::string logoUri;
    std::string tosUri;
    std::string policyUri;

    // Throws errors::ConfigurationError describing the first violation.
    void validate() const;

    // RFC 7591 registration request body.
    std::string toRegistrationJson() const;
};

//==========================================================================================================
// ClientCredentials
// Purpose: Identity issued by the authorization server (or supplied by the caller for pre-registered clients).
//==========================================================================================================
struct ClientCredentials {
    std::string clientId;
    std::optional<std::string> clientSecret;
    std::vector<std::string> redirectUris;
    std::string tokenEndpointAuthMethod; // empty: use the client metadata's method
    std::optional<std::int64_t> clientIdIssuedAt;
    std::optional<std::int64_t> clientSecretExpiresAt;

    // Parse an RFC 7591 registration response. Throws errors::ConfigurationError when malformed.
    static ClientCredentials fromRegistrationResponse(const std::string& body);
};

//==========================================================================================================
// TokenSet
// Purpose: Access token plus optional refresh token and lifetime. Treated as immutable; superseded as a whole.
//==========================================================================================================
struct TokenSet {
    std::string accessToken;
    std::optional<std::string> refreshToken;
    std::string tokenType{"Bearer"};
    std::optional<std::chrono::seconds> expiresIn;
    std::chrono::system_clock::time_point issuedAt{};
    std::optional<std::string> scope;

    // issuedAt + expiresIn, or std::nullopt when the server reported no lifetime.
    std::optional<std::chrono::system_clock::time_point> expiresAt() const;

    // True when now + margin has reached the expiry. Tokens without a lifetime never expire.
    bool isExpired(std::chrono::system_clock::time_point now, std::chrono::seconds margin) const;

    // Parse a successful token endpoint response.
    // Throws errors::ServerError("invalid_token_response") when the body is not a usable token document.
    static TokenSet fromTokenResponse(const std::string& body, std::chrono::system_clock::time_point issuedAt);
};

// Endpoints resolved from RFC 8414 metadata (or derived defaults).
struct AuthorizationServerMetadata {
    std::string issuer;
    std::string authorizationEndpoint;
    std::string tokenEndpoint;
    std::optional<std::string> registrationEndpoint;
    std::vector<std::string> codeChallengeMethodsSupported;
    std::vector<std::string> scopesSupported;

    // Throws errors::ConfigurationError when required endpoints are missing or the document is malformed.
    static AuthorizationServerMetadata fromJson(const std::string& body);
};

// Protected resource metadata (RFC 9728); only the fields the client consumes.
struct ProtectedResourceMetadata {
    std::string resource;
    std::vector<std::string> authorizationServers;
    std::vector<std::string> scopesSupported;

    static ProtectedResourceMetadata fromJson(const std::string& body);
};

//==========================================================================================================
// AuthorizationAttempt
// Purpose: Per-attempt secrets. Created fresh for each interactive authorization and never reused.
//==========================================================================================================
struct AuthorizationAttempt {
    std::string state;
    std::string codeVerifier;
    std::string codeChallenge;
    std::string redirectUri;
    std::string authorizationUrl;
    std::chrono::steady_clock::time_point deadline;
};

enum class ProviderState {
    Unregistered,
    Registered,
    AwaitingAuthorization,
    Exchanging,
    Authorized,
    Refreshing,
    Failed
};

const char* providerStateToString(ProviderState s);

// Legal edges of the provider lifecycle. Failed has no outgoing edges.
bool isLegalTransition(ProviderState from, ProviderState to);

} // namespace mcpauth::auth
