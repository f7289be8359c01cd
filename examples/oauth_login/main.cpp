//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Interactive OAuth login against an MCP server using the loopback callback listener
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <utility>
#include <boost/asio.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpauth/auth/AuthConfig.hpp"
#include "mcpauth/auth/OAuthClientProvider.hpp"
#include "mcpauth/errors/Errors.h"
#include "mcpauth/version.h"

using namespace mcpauth;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--url")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

//==========================================================================================================
// buildAuthConfig
// Purpose: Compose the AuthProviderFactory string from CLI options, falling back to MCPAUTH_* env vars.
//==========================================================================================================
static std::string buildAuthConfig(int argc, char** argv, const std::string& url) {
    std::string cfg = std::string("auth=oauth2; serverUrl=") + url;
    const unsigned long port = GetEnvUnsignedOrDefault("MCPAUTH_CALLBACK_PORT", 3030);
    cfg += "; callbackPort=" + getArgValue(argc, argv, "--port").value_or(std::to_string(port));
    const unsigned long timeoutMs = GetEnvUnsignedOrDefault("MCPAUTH_TIMEOUT_MS", 300000);
    cfg += "; timeoutMs=" + getArgValue(argc, argv, "--timeout-ms").value_or(std::to_string(timeoutMs));

    std::string clientId = getArgValue(argc, argv, "--client-id").value_or(GetEnvOrDefault("MCPAUTH_CLIENT_ID", ""));
    if (!clientId.empty()) {
        cfg += "; clientId=" + clientId;
        std::string secret = GetEnvOrDefault("MCPAUTH_CLIENT_SECRET", "");
        if (!secret.empty()) {
            cfg += "; clientSecret=" + secret;
        }
    }
    if (auto scope = getArgValue(argc, argv, "--scope"); scope.has_value()) {
        cfg += "; scope=" + *scope;
    }
    if (auto ca = getArgValue(argc, argv, "--cafile"); ca.has_value()) {
        cfg += "; caFile=" + *ca;
    }
    if (hasFlag(argc, argv, "--no-browser")) {
        cfg += "; openBrowser=false";
    }
    cfg += "; clientName=mcpauth oauth_login " + getVersionString();
    return cfg;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        Logger::setLogLevelFromString(*lvl);
    }

    std::string url = getArgValue(argc, argv, "--url").value_or("");
    if (url.empty()) {
        std::cerr << "usage: oauth_login --url=https://mcp.example.com/mcp [--scope=...] [--port=3030]"
                     " [--client-id=...] [--timeout-ms=...] [--cafile=...] [--no-browser] [--log-level=DEBUG]"
                  << std::endl;
        return 2;
    }

    std::shared_ptr<auth::OAuthClientProvider> provider;
    try {
        auth::AuthProviderFactory factory;
        provider = std::dynamic_pointer_cast<auth::OAuthClientProvider>(factory.CreateAuth(buildAuthConfig(argc, argv, url)));
    } catch (const errors::ConfigurationError& e) {
        std::cerr << "invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    provider->setErrorHandler([](const std::string& err) { LOG_WARN("auth: {}", err); });
    provider->setStateObserver([](auth::ProviderState from, auth::ProviderState to) {
        LOG_INFO("provider {} -> {}", auth::providerStateToString(from), auth::providerStateToString(to));
    });

    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([provider](const boost::system::error_code& ec, int) {
        if (!ec) {
            provider->cancel();
        }
    });

    std::exception_ptr outcome;
    std::string token;
    boost::asio::co_spawn(io,
        [provider, &token]() -> boost::asio::awaitable<void> {
            token = co_await provider->accessToken();
        },
        [&outcome, &signals](std::exception_ptr e) {
            outcome = e;
            signals.cancel();
        });
    io.run();

    if (outcome) {
        auto kind = errors::errorKindOf(outcome);
        std::cerr << "login failed: " << errors::describeException(outcome) << std::endl;
        return (kind && *kind == errors::ErrorKind::Cancellation) ? 130 : 1;
    }

    std::cout << "state: " << auth::providerStateToString(provider->state()) << std::endl;
    std::cout << "access token: " << token.substr(0, 8) << "... (" << token.size() << " chars)" << std::endl;
    for (const auto& h : provider->headers()) {
        std::cout << h.name << ": " << h.value.substr(0, h.value.find(' ') + 1) << "<redacted>" << std::endl;
    }
    return 0;
}
