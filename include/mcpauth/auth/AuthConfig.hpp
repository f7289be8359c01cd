//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/AuthConfig.hpp
// Purpose: Declarative auth configuration and the factory that turns it into an IAuth provider
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>

#include "mcpauth/auth/AuthorizationHandler.hpp"
#include "mcpauth/auth/IAuth.hpp"
#include "mcpauth/auth/OAuthClientProvider.hpp"
#include "mcpauth/auth/TokenStore.hpp"

namespace mcpauth::auth {

// Interactive OAuth. Null store/handler default to InMemoryTokenStore / LocalCallbackListener.
struct OAuthConfig {
    OAuthClientOptions options;
    std::shared_ptr<ITokenStore> tokenStore;
    std::shared_ptr<IAuthorizationHandler> handler;
};

struct ApiKeyConfig {
    std::string headerName{"X-API-Key"};
    std::string headerValue;
};

struct BearerAuthConfig {
    std::string token;
};

using AuthConfig = std::variant<OAuthConfig, ApiKeyConfig, BearerAuthConfig>;

//==========================================================================================================
// createAuthProvider
// Purpose: Build the provider for one endpoint.
// Args:
//   config: Provider configuration.
//   serverUrl: Endpoint URL; fills OAuthClientOptions::serverUrl when that is empty.
// Throws:
//   errors::ConfigurationError on invalid configuration.
//==========================================================================================================
std::shared_ptr<IAuth> createAuthProvider(const AuthConfig& config, const std::string& serverUrl);

//==========================================================================================================
// AuthProviderFactory
// Purpose: Parse "key=value; key=value" strings into a provider.
// Keys:
//   auth=oauth2|bearer|apikey|none, serverUrl, redirectUri, callbackPort, timeoutMs, clientName, clientId,
//   clientSecret, scope, tokenEndpointAuthMethod, openBrowser, caFile, caPath, connectTimeoutMs,
//   readTimeoutMs, bearerToken (alias token), headerName, headerValue (alias apiKey).
// Returns:
//   nullptr for auth=none (or no auth key).
//==========================================================================================================
class AuthProviderFactory {
public:
    std::shared_ptr<IAuth> CreateAuth(const std::string& config);

    static std::unordered_map<std::string, std::string> ParseConfig(const std::string& config);
};

} // namespace mcpauth::auth
