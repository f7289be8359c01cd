//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/OAuthTypes.cpp
// Purpose: Validation and (de)serialization of the OAuth client data model
//==========================================================================================================

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpauth/Json.h"
#include "mcpauth/auth/OAuthTypes.hpp"
#include "mcpauth/auth/UrlUtil.hpp"
#include "mcpauth/errors/Errors.h"
#include "mcpauth/version.h"

namespace mcpauth::auth {

using errors::ConfigurationError;
using errors::ServerError;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Parse a document expected to be a JSON object; returns std::nullopt when it is not.
std::optional<JSONValue::Object> parseObject(const std::string& body) {
    try {
        JSONValue v = parseJson(body);
        if (!v.isObject()) {
            return std::nullopt;
        }
        return std::get<JSONValue::Object>(v.value);
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("JSON parse failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace

void ClientMetadata::validate() const {
    if (redirectUris.empty()) {
        throw ConfigurationError("Client metadata requires at least one redirect URI");
    }
    for (const auto& uri : redirectUris) {
        UrlParts u = parseUrl(uri);
        if (!u.hasScheme || (u.scheme != "http" && u.scheme != "https") || u.host.empty()) {
            throw ConfigurationError(fmt::format("Redirect URI is not an absolute http(s) URI: '{}'", uri));
        }
    }
    if (!contains(responseTypes, "code")) {
        throw ConfigurationError("Client metadata response_types must include \"code\"");
    }
    if (grantTypes.empty()) {
        throw ConfigurationError("Client metadata grant_types must not be empty");
    }
    for (const auto& g : grantTypes) {
        if (g != "authorization_code" && g != "refresh_token") {
            throw ConfigurationError(fmt::format("Unsupported grant type in client metadata: '{}'", g));
        }
    }
    if (tokenEndpointAuthMethod != "none" && tokenEndpointAuthMethod != "client_secret_post" &&
        tokenEndpointAuthMethod != "client_secret_basic") {
        throw ConfigurationError(fmt::format("Unsupported token_endpoint_auth_method: '{}'", tokenEndpointAuthMethod));
    }
}

std::string ClientMetadata::toRegistrationJson() const {
    JSONValue::Object o;
    o["client_name"] = jsonString(clientName);
    o["redirect_uris"] = jsonStringArray(redirectUris);
    o["grant_types"] = jsonStringArray(grantTypes);
    o["response_types"] = jsonStringArray(responseTypes);
    o["token_endpoint_auth_method"] = jsonString(tokenEndpointAuthMethod);
    o["software_version"] = jsonString(getVersionString());
    if (!scope.empty()) o["scope"] = jsonString(scope);
    if (!clientUri.empty()) o["client_uri"] = jsonString(clientUri);
    if (!logoUri.empty()) o["logo_uri"] = jsonString(logoUri);
    if (!tosUri.empty()) o["tos_uri"] = jsonString(tosUri);
    if (!policyUri.empty()) o["policy_uri"] = jsonString(policyUri);
    return serializeJson(JSONValue(std::move(o)));
}

ClientCredentials ClientCredentials::fromRegistrationResponse(const std::string& body) {
    auto obj = parseObject(body);
    if (!obj) {
        throw ConfigurationError("Registration response is not a JSON object");
    }
    ClientCredentials c;
    auto id = jsonGetString(*obj, "client_id");
    if (!id || id->empty()) {
        throw ConfigurationError("Registration response is missing client_id");
    }
    c.clientId = *id;
    if (auto s = jsonGetString(*obj, "client_secret"); s && !s->empty()) {
        c.clientSecret = *s;
    }
    if (auto r = jsonGetStringArray(*obj, "redirect_uris")) {
        c.redirectUris = *r;
    }
    if (auto m = jsonGetString(*obj, "token_endpoint_auth_method")) {
        c.tokenEndpointAuthMethod = *m;
    }
    c.clientIdIssuedAt = jsonGetInt(*obj, "client_id_issued_at");
    c.clientSecretExpiresAt = jsonGetInt(*obj, "client_secret_expires_at");
    return c;
}

std::optional<std::chrono::system_clock::time_point> TokenSet::expiresAt() const {
    if (!expiresIn) {
        return std::nullopt;
    }
    return issuedAt + *expiresIn;
}

bool TokenSet::isExpired(std::chrono::system_clock::time_point now, std::chrono::seconds margin) const {
    auto at = expiresAt();
    if (!at) {
        return false;
    }
    return now + margin >= *at;
}

TokenSet TokenSet::fromTokenResponse(const std::string& body, std::chrono::system_clock::time_point issued) {
    auto obj = parseObject(body);
    if (!obj) {
        throw ServerError("invalid_token_response", "token endpoint returned a non-JSON body", 200);
    }
    auto at = jsonGetString(*obj, "access_token");
    if (!at || at->empty()) {
        throw ServerError("invalid_token_response", "token endpoint response is missing access_token", 200);
    }
    TokenSet t;
    t.accessToken = *at;
    t.issuedAt = issued;
    if (auto tt = jsonGetString(*obj, "token_type"); tt && !tt->empty()) {
        t.tokenType = *tt;
    }
    if (auto rt = jsonGetString(*obj, "refresh_token"); rt && !rt->empty()) {
        t.refreshToken = *rt;
    }
    if (auto ex = jsonGetInt(*obj, "expires_in"); ex && *ex >= 0) {
        t.expiresIn = std::chrono::seconds(*ex);
    }
    if (auto sc = jsonGetString(*obj, "scope")) {
        t.scope = *sc;
    }
    return t;
}

AuthorizationServerMetadata AuthorizationServerMetadata::fromJson(const std::string& body) {
    auto obj = parseObject(body);
    if (!obj) {
        throw ConfigurationError("Authorization server metadata is not a JSON object");
    }
    AuthorizationServerMetadata m;
    m.issuer = jsonGetString(*obj, "issuer").value_or(std::string());
    auto authz = jsonGetString(*obj, "authorization_endpoint");
    auto token = jsonGetString(*obj, "token_endpoint");
    if (!authz || authz->empty() || !token || token->empty()) {
        throw ConfigurationError("Authorization server metadata lacks authorization_endpoint or token_endpoint", m.issuer);
    }
    m.authorizationEndpoint = *authz;
    m.tokenEndpoint = *token;
    if (auto reg = jsonGetString(*obj, "registration_endpoint"); reg && !reg->empty()) {
        m.registrationEndpoint = *reg;
    }
    m.codeChallengeMethodsSupported = jsonGetStringArray(*obj, "code_challenge_methods_supported").value_or(std::vector<std::string>{});
    m.scopesSupported = jsonGetStringArray(*obj, "scopes_supported").value_or(std::vector<std::string>{});
    if (!m.codeChallengeMethodsSupported.empty() && !contains(m.codeChallengeMethodsSupported, "S256")) {
        LOG_WARN("Authorization server {} does not advertise S256 PKCE support", m.issuer);
    }
    return m;
}

ProtectedResourceMetadata ProtectedResourceMetadata::fromJson(const std::string& body) {
    auto obj = parseObject(body);
    if (!obj) {
        throw ConfigurationError("Protected resource metadata is not a JSON object");
    }
    ProtectedResourceMetadata m;
    m.resource = jsonGetString(*obj, "resource").value_or(std::string());
    m.authorizationServers = jsonGetStringArray(*obj, "authorization_servers").value_or(std::vector<std::string>{});
    m.scopesSupported = jsonGetStringArray(*obj, "scopes_supported").value_or(std::vector<std::string>{});
    return m;
}

const char* providerStateToString(ProviderState s) {
    switch (s) {
        case ProviderState::Unregistered: return "Unregistered";
        case ProviderState::Registered: return "Registered";
        case ProviderState::AwaitingAuthorization: return "AwaitingAuthorization";
        case ProviderState::Exchanging: return "Exchanging";
        case ProviderState::Authorized: return "Authorized";
        case ProviderState::Refreshing: return "Refreshing";
        case ProviderState::Failed: return "Failed";
    }
    return "Unknown";
}

bool isLegalTransition(ProviderState from, ProviderState to) {
    if (from == ProviderState::Failed) {
        return false;
    }
    if (to == ProviderState::Failed) {
        return true;
    }
    switch (from) {
        case ProviderState::Unregistered:
            return to == ProviderState::Registered || to == ProviderState::Authorized;
        case ProviderState::Registered:
            return to == ProviderState::AwaitingAuthorization || to == ProviderState::Refreshing ||
                   to == ProviderState::Authorized;
        case ProviderState::AwaitingAuthorization:
            return to == ProviderState::Exchanging;
        case ProviderState::Exchanging:
            return to == ProviderState::Authorized;
        case ProviderState::Authorized:
            return to == ProviderState::Refreshing || to == ProviderState::AwaitingAuthorization;
        case ProviderState::Refreshing:
            return to == ProviderState::Authorized || to == ProviderState::AwaitingAuthorization;
        case ProviderState::Failed:
            return false;
    }
    return false;
}

} // namespace mcpauth::auth
