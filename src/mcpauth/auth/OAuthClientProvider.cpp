//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/OAuthClientProvider.cpp
// Purpose: Authorization-code + PKCE state machine: discovery, registration, authorization, exchange, refresh
//==========================================================================================================

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcpauth/Json.h"
#include "mcpauth/auth/OAuthClientProvider.hpp"
#include "mcpauth/auth/Pkce.hpp"
#include "mcpauth/auth/UrlUtil.hpp"
#include "mcpauth/auth/WwwAuthenticate.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth::auth {
namespace net = boost::asio;
using std::chrono::steady_clock;

namespace {

// Time a cancelled handler gets to release its resources after a deadline.
constexpr std::chrono::seconds kHandlerTeardownGrace{1};

ErrorFn httpTrace() {
    return [](const std::string& msg) { LOG_DEBUG("{}", msg); };
}

// Releases the single-flight gate when the owning flow finishes, however it finishes.
struct FlowGate {
    std::mutex& mtx;
    std::shared_ptr<async::AsyncResult<bool>>& slot;
    std::shared_ptr<async::AsyncResult<bool>> mine;

    ~FlowGate() {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (slot == mine) {
                slot.reset();
            }
        }
        mine->setValue(true);
    }
};

// error / error_description members of an OAuth error body; empty when absent or not JSON.
std::pair<std::string, std::string> oauthErrorFields(const std::string& body) {
    try {
        JSONValue v = parseJson(body);
        if (!v.isObject()) {
            return {};
        }
        const auto& o = std::get<JSONValue::Object>(v.value);
        return {jsonGetString(o, "error").value_or(std::string()),
                jsonGetString(o, "error_description").value_or(std::string())};
    } catch (const std::runtime_error&) {
        return {};
    }
}

std::string stripTrailingSlash(std::string s) {
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

net::awaitable<bool> presentStep(std::shared_ptr<IAuthorizationHandler> h, std::string url) {
    co_await h->present(url);
    co_return true;
}

} // namespace

OAuthClientProvider::OAuthClientProvider(OAuthClientOptions options,
                                         std::shared_ptr<ITokenStore> tokenStore,
                                         std::shared_ptr<IAuthorizationHandler> authHandler)
    : opts(std::move(options)), store(std::move(tokenStore)), handler(std::move(authHandler)) {
    if (!store) {
        throw errors::ConfigurationError("OAuth client requires a token store");
    }
    if (!handler) {
        throw errors::ConfigurationError("OAuth client requires an authorization handler");
    }
    opts.clientMetadata.validate();
    if (opts.serverUrl.empty() && (opts.authorizationEndpoint.empty() || opts.tokenEndpoint.empty())) {
        throw errors::ConfigurationError("OAuth client requires a server URL or explicit authorization/token endpoints");
    }
    if (!opts.clock) {
        opts.clock = []() { return std::chrono::system_clock::now(); };
    }
}

OAuthClientProvider::~OAuthClientProvider() = default;

//==========================================================================================================
// ensureReady
// Purpose: Single-flight entry point. The first caller runs the flow; later callers wait for it and then
//          re-check (normally finding valid tokens, or the recorded failure).
//==========================================================================================================
net::awaitable<void> OAuthClientProvider::ensureReady() {
    std::shared_ptr<async::AsyncResult<bool>> mine;
    while (!mine) {
        std::shared_ptr<async::AsyncResult<bool>> other;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (flowInFlight) {
                other = flowInFlight;
            } else {
                mine = std::make_shared<async::AsyncResult<bool>>();
                flowInFlight = mine;
                cancelRequested = false;
            }
        }
        if (other) {
            co_await other->wait(steady_clock::time_point::max());
        }
    }
    FlowGate gate{mtx, flowInFlight, mine};

    std::exception_ptr error;
    try {
        co_await runFlow();
    } catch (const std::exception&) {
        error = std::current_exception();
    }
    if (error) {
        recordFailure(error);
        std::rethrow_exception(error);
    }
}

net::awaitable<std::string> OAuthClientProvider::accessToken() {
    co_await ensureReady();
    std::lock_guard<std::mutex> lk(mtx);
    co_return activeTokens ? activeTokens->accessToken : std::string();
}

net::awaitable<void> OAuthClientProvider::runFlow() {
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (current == ProviderState::Failed) {
            std::rethrow_exception(failure);
        }
    }

    auto tokens = store->getTokens();
    if (tokens && !tokens->isExpired(now(), opts.expirySafetyMargin)) {
        adoptTokens(*tokens);
        if (state() != ProviderState::Authorized) {
            transitionTo(ProviderState::Authorized);
        }
        co_return;
    }

    AuthorizationServerMetadata md = co_await resolveEndpoints();
    throwIfCancelled();
    ClientCredentials creds = co_await ensureRegistered(md);
    throwIfCancelled();

    if (tokens) {
        if (tokens->refreshToken) {
            if (co_await refresh(creds, *tokens, md)) {
                co_return;
            }
        } else {
            LOG_INFO("Access token for {} expired and no refresh token is available; re-authorizing", opts.serverUrl);
            store->clearTokens();
        }
    }
    co_await authorize(creds, md);
}

//==========================================================================================================
// resolveEndpoints
// Purpose: RFC 9728 protected resource metadata, then RFC 8414 authorization server metadata; a missing
//          document falls back to <origin>/authorize, /token and /register. Explicit endpoints always win.
//==========================================================================================================
net::awaitable<AuthorizationServerMetadata> OAuthClientProvider::resolveEndpoints() {
    std::string prmUrl;
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (endpoints) {
            co_return *endpoints;
        }
        prmUrl = resourceMetadataUrl;
    }

    AuthorizationServerMetadata md;
    bool discovered = false;
    std::string authServer = opts.serverUrl.empty() ? originOf(opts.authorizationEndpoint) : originOf(opts.serverUrl);

    if (opts.discoverMetadata && !opts.serverUrl.empty()) {
        if (prmUrl.empty()) {
            prmUrl = originOf(opts.serverUrl) + std::string("/.well-known/oauth-protected-resource");
        }
        HttpResponse prm = co_await coHttpRequest(httpParams(prmUrl), nullptr, httpTrace());
        if (prm.ok()) {
            try {
                auto resource = ProtectedResourceMetadata::fromJson(prm.body);
                if (!resource.authorizationServers.empty()) {
                    authServer = stripTrailingSlash(resource.authorizationServers.front());
                }
            } catch (const errors::ConfigurationError& e) {
                LOG_WARN("Ignoring malformed protected resource metadata at {}: {}", prmUrl, e.what());
            }
        }

        UrlParts as = parseUrl(authServer);
        std::string suffix = as.path == "/" ? std::string() : stripTrailingSlash(as.path);
        std::string wellKnown = originOf(authServer) + std::string("/.well-known/oauth-authorization-server") + suffix;
        HttpResponse asResp = co_await coHttpRequest(httpParams(wellKnown), nullptr, httpTrace());
        if (asResp.ok()) {
            md = AuthorizationServerMetadata::fromJson(asResp.body);
            discovered = true;
            LOG_INFO("Discovered authorization server metadata at {}", wellKnown);
        } else {
            LOG_INFO("No authorization server metadata at {} (HTTP {}); using default endpoints", wellKnown, asResp.status);
        }
    }

    if (!discovered) {
        const std::string base = originOf(authServer);
        md.issuer = base;
        md.authorizationEndpoint = base + std::string("/authorize");
        md.tokenEndpoint = base + std::string("/token");
        md.registrationEndpoint = base + std::string("/register");
    }
    if (!opts.authorizationEndpoint.empty()) md.authorizationEndpoint = opts.authorizationEndpoint;
    if (!opts.tokenEndpoint.empty()) md.tokenEndpoint = opts.tokenEndpoint;
    if (!opts.registrationEndpoint.empty()) md.registrationEndpoint = opts.registrationEndpoint;

    std::lock_guard<std::mutex> lk(mtx);
    endpoints = md;
    co_return md;
}

//==========================================================================================================
// ensureRegistered
// Purpose: Use stored credentials, or register once per provider lifetime.
// Notes:
//   - A registration that never got an HTTP response (network error, timeout) is not counted as attempted.
//==========================================================================================================
net::awaitable<ClientCredentials> OAuthClientProvider::ensureRegistered(const AuthorizationServerMetadata& md) {
    if (auto stored = store->getClientCredentials()) {
        if (state() == ProviderState::Unregistered) {
            transitionTo(ProviderState::Registered);
        }
        co_return *stored;
    }
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (registrationAttempted) {
            throw errors::ConfigurationError("Dynamic client registration was already attempted and produced no credentials",
                                             opts.serverUrl);
        }
    }
    if (!md.registrationEndpoint) {
        throw errors::ConfigurationError("Authorization server offers no registration endpoint and no client credentials were supplied",
                                         md.issuer);
    }

    HttpRequestParams p = httpParams(*md.registrationEndpoint);
    p.method = "POST";
    p.contentType = "application/json";
    p.body = opts.clientMetadata.toRegistrationJson();
    LOG_INFO("Registering OAuth client '{}' at {}", opts.clientMetadata.clientName, *md.registrationEndpoint);
    HttpResponse resp = co_await coHttpRequest(p, nullptr, httpTrace());
    {
        std::lock_guard<std::mutex> lk(mtx);
        registrationAttempted = true;
    }

    if (!resp.ok()) {
        auto [code, desc] = oauthErrorFields(resp.body);
        if (resp.status >= 500) {
            throw errors::ServerError(code.empty() ? std::string("server_error") : code, desc, resp.status, *md.registrationEndpoint);
        }
        throw errors::ConfigurationError(
            fmt::format("Client registration rejected (HTTP {}): {}{}", resp.status,
                        code.empty() ? std::string("no error code") : code,
                        desc.empty() ? std::string() : std::string(" - ") + desc),
            *md.registrationEndpoint);
    }
    ClientCredentials creds = ClientCredentials::fromRegistrationResponse(resp.body);
    store->setClientCredentials(creds);
    LOG_INFO("Registered OAuth client id {}", creds.clientId);
    if (state() == ProviderState::Unregistered) {
        transitionTo(ProviderState::Registered);
    }
    co_return creds;
}

//==========================================================================================================
// refresh
// Returns:
//   true when new tokens were stored; false when the caller should fall back to interactive authorization.
//==========================================================================================================
net::awaitable<bool> OAuthClientProvider::refresh(const ClientCredentials& creds, const TokenSet& tokens,
                                                  const AuthorizationServerMetadata& md) {
    transitionTo(ProviderState::Refreshing);
    const RefreshPolicy& policy = opts.refreshPolicy;
    auto backoff = policy.initialBackoff;
    unsigned int attempt = 0;
    for (;;) {
        std::exception_ptr rejection;
        std::string code;
        try {
            std::vector<std::pair<std::string, std::string>> form{
                {"grant_type", "refresh_token"},
                {"refresh_token", *tokens.refreshToken},
            };
            TokenSet fresh = co_await requestToken(md, creds, std::move(form));
            if (!fresh.refreshToken) {
                fresh.refreshToken = tokens.refreshToken;
            }
            store->setTokens(fresh);
            adoptTokens(fresh);
            transitionTo(ProviderState::Authorized);
            LOG_INFO("Refreshed access token for {}", opts.serverUrl);
            co_return true;
        } catch (const errors::ServerError& e) {
            rejection = std::current_exception();
            code = e.errorCode();
        }

        const bool retryable = std::find(policy.retryableErrors.begin(), policy.retryableErrors.end(), code) !=
                               policy.retryableErrors.end();
        if (retryable && attempt < policy.maxRetries) {
            ++attempt;
            LOG_WARN("Token refresh returned {}; retry {}/{} in {} ms", code, attempt, policy.maxRetries, backoff.count());
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(backoff);
            co_await timer.async_wait(net::use_awaitable);
            backoff *= 2;
            throwIfCancelled();
            continue;
        }
        if (!policy.reauthorizeOnRejection) {
            std::rethrow_exception(rejection);
        }
        LOG_WARN("Refresh token rejected ({}); discarding stored tokens and re-authorizing", code);
        store->clearTokens();
        {
            std::lock_guard<std::mutex> lk(mtx);
            activeTokens.reset();
        }
        co_return false;
    }
}

template <typename T>
net::awaitable<T> OAuthClientProvider::awaitHandlerStep(net::awaitable<T> step,
                                                        steady_clock::time_point deadline,
                                                        const char* what) {
    auto ex = co_await net::this_coro::executor;
    auto slot = std::make_shared<async::AsyncResult<T>>();
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (cancelRequested) {
            throw errors::CancellationError("Authorization cancelled by caller", std::string(), std::string(), opts.serverUrl);
        }
        abortPendingStep = [slot, url = opts.serverUrl]() {
            slot->setException(std::make_exception_ptr(
                errors::CancellationError("Authorization cancelled by caller", std::string(), std::string(), url)));
        };
    }
    auto keepAlive = handler;
    net::co_spawn(ex, std::move(step), [slot, keepAlive](std::exception_ptr e, T value) {
        if (e) {
            slot->setException(e);
        } else {
            slot->setValue(std::move(value));
        }
    });

    const bool done = co_await slot->wait(deadline);
    if (!done) {
        handler->cancel();
        co_await slot->wait(steady_clock::now() + kHandlerTeardownGrace);
    }
    {
        std::lock_guard<std::mutex> lk(mtx);
        abortPendingStep = nullptr;
    }
    if (!done) {
        throw errors::TimeoutError(fmt::format("Authorization {} did not complete within {} ms", what, opts.authorizationTimeout.count()),
                                   opts.authorizationTimeout, opts.serverUrl);
    }
    co_return slot->get();
}

net::awaitable<void> OAuthClientProvider::authorize(const ClientCredentials& creds, const AuthorizationServerMetadata& md) {
    AuthorizationAttempt attempt;
    attempt.state = generateState();
    attempt.codeVerifier = generateCodeVerifier();
    attempt.codeChallenge = deriveCodeChallenge(attempt.codeVerifier);
    attempt.redirectUri = opts.clientMetadata.redirectUris.front();
    attempt.deadline = steady_clock::now() + opts.authorizationTimeout;

    std::vector<std::pair<std::string, std::string>> query{
        {"response_type", "code"},
        {"client_id", creds.clientId},
        {"redirect_uri", attempt.redirectUri},
        {"state", attempt.state},
        {"code_challenge", attempt.codeChallenge},
        {"code_challenge_method", "S256"},
    };
    const std::string scope = effectiveScope();
    if (!scope.empty()) {
        query.emplace_back("scope", scope);
    }
    attempt.authorizationUrl = appendQuery(md.authorizationEndpoint, query);

    transitionTo(ProviderState::AwaitingAuthorization);
    co_await awaitHandlerStep(presentStep(handler, attempt.authorizationUrl), attempt.deadline, "presentation");
    AuthorizationCallback callback = co_await awaitHandlerStep(handler->collect(attempt.deadline), attempt.deadline, "callback");

    if (callback.code.empty()) {
        throw errors::CallbackError("Authorization redirect did not include a code", opts.serverUrl);
    }
    if (!callback.state) {
        if (opts.requireState) {
            throw errors::CallbackError("Authorization redirect is missing the state parameter", opts.serverUrl);
        }
        LOG_WARN("Authorization redirect carried no state parameter; accepting because requireState is off");
    } else if (!constantTimeEquals(*callback.state, attempt.state)) {
        throw errors::CallbackError("Authorization redirect state does not match the pending attempt", opts.serverUrl);
    }
    throwIfCancelled();

    transitionTo(ProviderState::Exchanging);
    std::vector<std::pair<std::string, std::string>> form{
        {"grant_type", "authorization_code"},
        {"code", callback.code},
        {"redirect_uri", attempt.redirectUri},
        {"code_verifier", attempt.codeVerifier},
    };
    TokenSet tokens = co_await requestToken(md, creds, std::move(form));
    store->setTokens(tokens);
    adoptTokens(tokens);
    transitionTo(ProviderState::Authorized);
    LOG_INFO("Authorized against {}", opts.serverUrl);
}

net::awaitable<TokenSet> OAuthClientProvider::requestToken(const AuthorizationServerMetadata& md,
                                                           const ClientCredentials& creds,
                                                           std::vector<std::pair<std::string, std::string>> form) {
    const std::string method = creds.tokenEndpointAuthMethod.empty() ? opts.clientMetadata.tokenEndpointAuthMethod
                                                                      : creds.tokenEndpointAuthMethod;
    HttpRequestParams p = httpParams(md.tokenEndpoint);
    form.emplace_back("client_id", creds.clientId);
    if (creds.clientSecret && !creds.clientSecret->empty()) {
        if (method == "client_secret_basic") {
            p.headers.push_back(HeaderKV{"Authorization",
                std::string("Basic ") + base64Encode(formUrlEncode(creds.clientId) + std::string(":") + formUrlEncode(*creds.clientSecret))});
        } else if (method != "none") {
            form.emplace_back("client_secret", *creds.clientSecret);
        }
    }

    HttpResponse resp = co_await coPostFormUrlencoded(p, encodeForm(form), nullptr, httpTrace());
    if (!resp.ok()) {
        auto [code, desc] = oauthErrorFields(resp.body);
        if (code.empty()) {
            code = fmt::format("http_{}", resp.status);
        }
        throw errors::ServerError(code, desc, resp.status, md.tokenEndpoint);
    }
    co_return TokenSet::fromTokenResponse(resp.body, now());
}

std::vector<HeaderKV> OAuthClientProvider::headers() const {
    const auto at = now();
    std::lock_guard<std::mutex> lk(mtx);
    if (current != ProviderState::Authorized || !activeTokens || activeTokens->accessToken.empty()) {
        return {};
    }
    if (activeTokens->isExpired(at, opts.expirySafetyMargin)) {
        return {};
    }
    return { HeaderKV{ "Authorization", std::string("Bearer ") + activeTokens->accessToken } };
}

void OAuthClientProvider::setErrorHandler(std::function<void(const std::string&)> fn) {
    std::lock_guard<std::mutex> lk(mtx);
    errorHandler = std::move(fn);
}

ProviderState OAuthClientProvider::state() const {
    std::lock_guard<std::mutex> lk(mtx);
    return current;
}

std::exception_ptr OAuthClientProvider::lastError() const {
    std::lock_guard<std::mutex> lk(mtx);
    return failure;
}

void OAuthClientProvider::setStateObserver(StateObserver fn) {
    std::lock_guard<std::mutex> lk(mtx);
    observer = std::move(fn);
}

void OAuthClientProvider::cancel() {
    std::function<void()> abort;
    bool inFlight = false;
    {
        std::lock_guard<std::mutex> lk(mtx);
        cancelRequested = true;
        abort = abortPendingStep;
        inFlight = static_cast<bool>(flowInFlight);
    }
    if (!inFlight) {
        return;
    }
    LOG_INFO("Cancelling OAuth flow for {}", opts.serverUrl);
    handler->cancel();
    if (abort) {
        abort();
    }
}

void OAuthClientProvider::reset() {
    ProviderState prev;
    {
        std::lock_guard<std::mutex> lk(mtx);
        prev = current;
        current = ProviderState::Unregistered;
        failure = nullptr;
        endpoints.reset();
        activeTokens.reset();
        cancelRequested = false;
    }
    LOG_INFO("OAuth provider for {} reset from {}", opts.serverUrl, providerStateToString(prev));
}

void OAuthClientProvider::invalidate(const std::string& wwwAuthenticate) {
    bool dropTokens = false;
    if (!wwwAuthenticate.empty()) {
        if (auto challenge = parseBearerChallenge(wwwAuthenticate)) {
            std::lock_guard<std::mutex> lk(mtx);
            if (!challenge->resourceMetadata.empty() && challenge->resourceMetadata != resourceMetadataUrl) {
                resourceMetadataUrl = challenge->resourceMetadata;
                endpoints.reset();
            }
            if (!challenge->scope.empty()) {
                challengeScope = challenge->scope;
            }
            dropTokens = challenge->error == "insufficient_scope";
        }
    }
    if (dropTokens) {
        LOG_INFO("Resource requires a broader scope; discarding tokens for {}", opts.serverUrl);
        store->clearTokens();
    } else if (auto tokens = store->getTokens()) {
        TokenSet stale = *tokens;
        stale.expiresIn = std::chrono::seconds(0);
        store->setTokens(stale);
    }
    std::lock_guard<std::mutex> lk(mtx);
    activeTokens.reset();
}

void OAuthClientProvider::transitionTo(ProviderState next) {
    ProviderState prev;
    StateObserver obs;
    {
        std::lock_guard<std::mutex> lk(mtx);
        prev = current;
        if (!isLegalTransition(prev, next)) {
            throw std::logic_error(fmt::format("Illegal OAuth provider transition {} -> {}",
                                               providerStateToString(prev), providerStateToString(next)));
        }
        current = next;
        obs = observer;
    }
    LOG_DEBUG("OAuth provider {}: {} -> {}", opts.serverUrl, providerStateToString(prev), providerStateToString(next));
    if (obs) {
        obs(prev, next);
    }
}

void OAuthClientProvider::recordFailure(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (current == ProviderState::Failed) {
            return;
        }
        failure = error;
        activeTokens.reset();
    }
    transitionTo(ProviderState::Failed);
    const std::string what = errors::describeException(error);
    LOG_ERROR("OAuth flow for {} failed: {}", opts.serverUrl, what);
    report(what);
}

void OAuthClientProvider::adoptTokens(const TokenSet& tokens) {
    std::lock_guard<std::mutex> lk(mtx);
    activeTokens = tokens;
}

void OAuthClientProvider::throwIfCancelled() const {
    std::lock_guard<std::mutex> lk(mtx);
    if (cancelRequested) {
        throw errors::CancellationError("Authorization cancelled by caller", std::string(), std::string(), opts.serverUrl);
    }
}

void OAuthClientProvider::report(const std::string& msg) const {
    std::function<void(const std::string&)> fn;
    {
        std::lock_guard<std::mutex> lk(mtx);
        fn = errorHandler;
    }
    if (fn) {
        fn(msg);
    }
}

std::string OAuthClientProvider::effectiveScope() const {
    if (!opts.scope.empty()) {
        return opts.scope;
    }
    std::lock_guard<std::mutex> lk(mtx);
    return challengeScope.empty() ? opts.clientMetadata.scope : challengeScope;
}

HttpRequestParams OAuthClientProvider::httpParams(const std::string& url) const {
    HttpRequestParams p;
    p.url = url;
    p.caFile = opts.caFile;
    p.caPath = opts.caPath;
    p.connectTimeoutMs = opts.connectTimeoutMs;
    p.readTimeoutMs = opts.readTimeoutMs;
    return p;
}

std::chrono::system_clock::time_point OAuthClientProvider::now() const {
    return opts.clock();
}

} // namespace mcpauth::auth
