//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/OAuthClientProvider.hpp
// Purpose: OAuth 2.0 authorization-code + PKCE client (dynamic registration, exchange, refresh) as IAuth
//==========================================================================================================
#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include "mcpauth/async/AsyncResult.h"
#include "mcpauth/auth/AuthorizationHandler.hpp"
#include "mcpauth/auth/HttpClient.hpp"
#include "mcpauth/auth/IAuth.hpp"
#include "mcpauth/auth/OAuthTypes.hpp"
#include "mcpauth/auth/TokenStore.hpp"

namespace mcpauth::auth {

//==========================================================================================================
// RefreshPolicy
// Purpose: What to do when the token endpoint rejects a refresh.
// Fields:
//   reauthorizeOnRejection: Discard stored tokens and run the interactive flow (otherwise surface the error).
//   maxRetries: Retries for error codes listed in retryableErrors before the rejection is final.
//   initialBackoff: Delay before the first retry; doubled on each subsequent retry.
//==========================================================================================================
struct RefreshPolicy {
    bool reauthorizeOnRejection{true};
    unsigned int maxRetries{0};
    std::chrono::milliseconds initialBackoff{500};
    std::vector<std::string> retryableErrors{"temporarily_unavailable", "slow_down"};
};

struct OAuthClientOptions {
    std::string serverUrl;                 // protected MCP endpoint; discovery starts from its origin
    ClientMetadata clientMetadata;
    std::string scope;                     // overrides clientMetadata.scope when set
    std::chrono::milliseconds authorizationTimeout{std::chrono::minutes(5)};
    std::chrono::seconds expirySafetyMargin{60};
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    std::string caFile;
    std::string caPath;
    bool discoverMetadata{true};
    bool requireState{true};               // reject redirects without a state parameter
    std::string authorizationEndpoint;     // explicit endpoints bypass discovery for that endpoint
    std::string tokenEndpoint;
    std::string registrationEndpoint;
    RefreshPolicy refreshPolicy;
    std::function<std::chrono::system_clock::time_point()> clock; // defaults to system_clock::now
};

//==========================================================================================================
// OAuthClientProvider
// Purpose: Drives Unregistered -> Registered -> AwaitingAuthorization -> Exchanging -> Authorized
//          (with Refreshing, and Failed as the absorbing error state) for one authorization server.
// Notes:
//   - All coroutines must run on a single-threaded executor. Concurrent ensureReady() callers share one flow.
//   - Failed stays Failed: ensureReady() rethrows the recorded error until reset() is called.
//   - headers() is synchronous and returns the bearer header only while Authorized and the adopted token is
//     outside the expiry safety margin; otherwise callers go back through ensureReady().
//==========================================================================================================
class OAuthClientProvider final : public IAuth {
public:
    using StateObserver = std::function<void(ProviderState from, ProviderState to)>;

    // Throws errors::ConfigurationError when the client metadata is invalid or a dependency is missing.
    OAuthClientProvider(OAuthClientOptions options,
                        std::shared_ptr<ITokenStore> store,
                        std::shared_ptr<IAuthorizationHandler> handler);
    ~OAuthClientProvider() override;

    OAuthClientProvider(const OAuthClientProvider&) = delete;
    OAuthClientProvider& operator=(const OAuthClientProvider&) = delete;

    boost::asio::awaitable<void> ensureReady() override;
    std::vector<HeaderKV> headers() const override;
    void setErrorHandler(std::function<void(const std::string&)> fn) override;

    // ensureReady() followed by the current access token.
    boost::asio::awaitable<std::string> accessToken();

    ProviderState state() const;
    std::exception_ptr lastError() const;
    void setStateObserver(StateObserver fn);

    // Abort an in-flight flow; the pending ensureReady() fails with errors::CancellationError.
    void cancel();

    // Leave Failed (or any state) and start over from Unregistered. Stored credentials/tokens are kept.
    void reset();

    //==========================================================================================================
    // invalidate
    // Purpose: React to a 401/403 from the protected resource: drop the cached access token so the next
    //          ensureReady() refreshes or re-authorizes, and honor resource_metadata/scope from the challenge.
    // Args:
    //   wwwAuthenticate: WWW-Authenticate header value (may be empty).
    //==========================================================================================================
    void invalidate(const std::string& wwwAuthenticate = std::string());

    const OAuthClientOptions& options() const { return opts; }

private:
    boost::asio::awaitable<void> runFlow();
    boost::asio::awaitable<AuthorizationServerMetadata> resolveEndpoints();
    boost::asio::awaitable<ClientCredentials> ensureRegistered(const AuthorizationServerMetadata& md);
    boost::asio::awaitable<bool> refresh(const ClientCredentials& creds, const TokenSet& tokens,
                                         const AuthorizationServerMetadata& md);
    boost::asio::awaitable<void> authorize(const ClientCredentials& creds, const AuthorizationServerMetadata& md);
    boost::asio::awaitable<TokenSet> requestToken(const AuthorizationServerMetadata& md, const ClientCredentials& creds,
                                                  std::vector<std::pair<std::string, std::string>> form);
    template <typename T>
    boost::asio::awaitable<T> awaitHandlerStep(boost::asio::awaitable<T> step,
                                               std::chrono::steady_clock::time_point deadline,
                                               const char* what);

    void transitionTo(ProviderState next);
    void recordFailure(std::exception_ptr error);
    void adoptTokens(const TokenSet& tokens);
    void throwIfCancelled() const;
    void report(const std::string& msg) const;
    std::string effectiveScope() const;
    HttpRequestParams httpParams(const std::string& url) const;
    std::chrono::system_clock::time_point now() const;

    OAuthClientOptions opts;
    std::shared_ptr<ITokenStore> store;
    std::shared_ptr<IAuthorizationHandler> handler;

    mutable std::mutex mtx;
    ProviderState current{ProviderState::Unregistered};
    std::exception_ptr failure;
    std::optional<TokenSet> activeTokens;
    bool registrationAttempted{false};
    bool cancelRequested{false};
    std::string resourceMetadataUrl;
    std::string challengeScope;
    std::optional<AuthorizationServerMetadata> endpoints;
    std::shared_ptr<async::AsyncResult<bool>> flowInFlight;
    std::function<void()> abortPendingStep;
    StateObserver observer;
    std::function<void(const std::string&)> errorHandler;
};

using OAuthClientProviderPtr = std::shared_ptr<OAuthClientProvider>;

} // namespace mcpauth::auth
