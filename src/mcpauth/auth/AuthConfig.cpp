//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/AuthConfig.cpp
// Purpose: Auth provider construction from typed configuration or "key=value; ..." strings
//==========================================================================================================

#include <cctype>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpauth/auth/ApiKeyAuth.hpp"
#include "mcpauth/auth/AuthConfig.hpp"
#include "mcpauth/auth/BearerAuth.hpp"
#include "mcpauth/auth/LocalCallbackListener.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth::auth {

namespace {

const char* kDefaultRedirectUri = "http://localhost:3030/callback";

std::string trim(std::string s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

unsigned long parseNumber(const std::string& key, const std::string& val) {
    std::size_t used = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(val, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (val.empty() || used != val.size()) {
        throw errors::ConfigurationError(fmt::format("Auth config '{}' must be a non-negative integer, got '{}'", key, val));
    }
    return n;
}

bool parseFlag(const std::string& val) {
    std::string v = lower(val);
    return !(v == "0" || v == "false" || v == "no" || v == "off");
}

} // namespace

std::shared_ptr<IAuth> createAuthProvider(const AuthConfig& config, const std::string& serverUrl) {
    if (const auto* bearer = std::get_if<BearerAuthConfig>(&config)) {
        return std::make_shared<BearerAuth>(bearer->token);
    }
    if (const auto* apiKey = std::get_if<ApiKeyConfig>(&config)) {
        if (apiKey->headerName.empty()) {
            throw errors::ConfigurationError("API key auth requires a header name");
        }
        return std::make_shared<ApiKeyAuth>(apiKey->headerName, apiKey->headerValue);
    }

    const auto& oauth = std::get<OAuthConfig>(config);
    OAuthClientOptions opts = oauth.options;
    if (opts.serverUrl.empty()) {
        opts.serverUrl = serverUrl;
    }
    if (opts.clientMetadata.redirectUris.empty()) {
        opts.clientMetadata.redirectUris.push_back(kDefaultRedirectUri);
    }
    auto store = oauth.tokenStore ? oauth.tokenStore : std::make_shared<InMemoryTokenStore>();
    auto handler = oauth.handler;
    if (!handler) {
        LocalCallbackListener::Options listenerOpts;
        listenerOpts.redirectUri = opts.clientMetadata.redirectUris.front();
        listenerOpts.timeout = opts.authorizationTimeout;
        handler = std::make_shared<LocalCallbackListener>(listenerOpts);
    }
    return std::make_shared<OAuthClientProvider>(std::move(opts), std::move(store), std::move(handler));
}

std::unordered_map<std::string, std::string> AuthProviderFactory::ParseConfig(const std::string& config) {
    std::unordered_map<std::string, std::string> out;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                throw errors::ConfigurationError(fmt::format("Auth config entry '{}' is not key=value", kv));
            }
            out[trim(kv.substr(0, eq))] = trim(kv.substr(eq + 1));
        }
        start = sep + 1;
    }
    return out;
}

//==========================================================================================================
// AuthProviderFactory::CreateAuth
// Purpose: Parse semicolon-delimited key=value config and create the provider it names.
//==========================================================================================================
std::shared_ptr<IAuth> AuthProviderFactory::CreateAuth(const std::string& config) {
    auto kv = ParseConfig(config);
    auto get = [&kv](const char* key) -> std::string {
        auto it = kv.find(key);
        return it == kv.end() ? std::string() : it->second;
    };
    auto has = [&kv](const char* key) { return kv.find(key) != kv.end(); };

    const std::string kind = lower(get("auth"));
    if (kind.empty() || kind == "none") {
        return nullptr;
    }
    if (kind == "bearer") {
        return createAuthProvider(BearerAuthConfig{has("bearerToken") ? get("bearerToken") : get("token")}, get("serverUrl"));
    }
    if (kind == "apikey") {
        ApiKeyConfig c;
        if (has("headerName")) c.headerName = get("headerName");
        c.headerValue = has("headerValue") ? get("headerValue") : get("apiKey");
        return createAuthProvider(c, get("serverUrl"));
    }
    if (kind != "oauth2" && kind != "oauth") {
        throw errors::ConfigurationError(fmt::format("Unknown auth kind '{}'", kind));
    }

    OAuthConfig c;
    OAuthClientOptions& o = c.options;
    o.serverUrl = get("serverUrl");
    std::string redirect = get("redirectUri");
    if (redirect.empty()) {
        unsigned long port = has("callbackPort") ? parseNumber("callbackPort", get("callbackPort")) : 3030ul;
        if (port == 0 || port > 65535ul) {
            throw errors::ConfigurationError(fmt::format("callbackPort out of range: {}", port));
        }
        redirect = fmt::format("http://localhost:{}/callback", port);
    }
    o.clientMetadata.redirectUris = {redirect};
    if (has("clientName")) o.clientMetadata.clientName = get("clientName");
    if (has("scope")) o.scope = get("scope");
    if (has("tokenEndpointAuthMethod")) o.clientMetadata.tokenEndpointAuthMethod = get("tokenEndpointAuthMethod");
    if (has("timeoutMs")) o.authorizationTimeout = std::chrono::milliseconds(parseNumber("timeoutMs", get("timeoutMs")));
    if (has("connectTimeoutMs")) o.connectTimeoutMs = static_cast<unsigned int>(parseNumber("connectTimeoutMs", get("connectTimeoutMs")));
    if (has("readTimeoutMs")) o.readTimeoutMs = static_cast<unsigned int>(parseNumber("readTimeoutMs", get("readTimeoutMs")));
    if (has("caFile")) o.caFile = get("caFile");
    if (has("caPath")) o.caPath = get("caPath");

    if (has("clientId")) {
        ClientCredentials creds;
        creds.clientId = get("clientId");
        if (has("clientSecret") && !get("clientSecret").empty()) {
            creds.clientSecret = get("clientSecret");
        }
        creds.redirectUris = {redirect};
        c.tokenStore = std::make_shared<InMemoryTokenStore>(std::move(creds));
    }

    LocalCallbackListener::Options listenerOpts;
    listenerOpts.redirectUri = redirect;
    listenerOpts.timeout = o.authorizationTimeout;
    listenerOpts.openBrowser = has("openBrowser") ? parseFlag(get("openBrowser")) : true;
    c.handler = std::make_shared<LocalCallbackListener>(listenerOpts);

    LOG_DEBUG("AuthProviderFactory: oauth2 for {} redirect={}", o.serverUrl, redirect);
    return createAuthProvider(c, o.serverUrl);
}

} // namespace mcpauth::auth
