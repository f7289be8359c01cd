//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/MultiServerAuthBinder.cpp
// Purpose: Concurrent connect/close of several MCP endpoints with per-endpoint auth
//==========================================================================================================

#include <atomic>
#include <fmt/format.h>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>

#include "logging/Logger.h"
#include "mcpauth/MultiServerAuthBinder.hpp"
#include "mcpauth/async/AsyncResult.h"

namespace mcpauth {
namespace net = boost::asio;

CompositeConnectError::CompositeConnectError(std::vector<EndpointFailure> f)
    : std::runtime_error(summarize(f)), items(std::move(f)) {}

std::string CompositeConnectError::summarize(const std::vector<EndpointFailure>& f) {
    std::string msg = fmt::format("{} endpoint(s) failed to connect", f.size());
    for (const auto& item : f) {
        msg += fmt::format("; {} ({}): {}", item.endpoint.name, item.endpoint.url, item.message);
    }
    return msg;
}

MultiServerAuthBinder::MultiServerAuthBinder(std::vector<EndpointDescriptor> eps,
                                             std::vector<std::shared_ptr<auth::IAuth>> authProviders,
                                             std::shared_ptr<IEndpointConnector> conn,
                                             BinderOptions options)
    : endpoints(std::move(eps)), auths(std::move(authProviders)), connector(std::move(conn)), opts(std::move(options)) {
    if (!connector) {
        throw errors::ConfigurationError("MultiServerAuthBinder requires an endpoint connector");
    }
    if (auths.empty()) {
        auths.resize(endpoints.size());
    }
    if (auths.size() != endpoints.size()) {
        throw errors::ConfigurationError(fmt::format("Got {} endpoints but {} auth providers; the lists must be parallel",
                                                     endpoints.size(), auths.size()));
    }
    connected.resize(endpoints.size());
}

MultiServerAuthBinder::~MultiServerAuthBinder() {
    std::lock_guard<std::mutex> lk(mtx);
    for (std::size_t i = 0; i < connected.size(); ++i) {
        if (connected[i]) {
            LOG_WARN("Endpoint '{}' still connected at binder destruction; call closeAll() first", endpoints[i].name);
        }
    }
}

net::awaitable<std::unique_ptr<IEndpointSession>> MultiServerAuthBinder::connectOne(std::size_t index) {
    const EndpointDescriptor& ep = endpoints[index];
    const auto& authProvider = auths[index];
    LOG_INFO("Connecting to '{}' at {}{}", ep.name, ep.url, authProvider ? std::string(" (authenticated)") : std::string());
    if (authProvider) {
        co_await authProvider->ensureReady();
    }
    auto session = co_await connector->connect(ep, authProvider);
    if (!session) {
        throw errors::ConfigurationError("Connector returned no session", ep.url);
    }
    co_return session;
}

//==========================================================================================================
// connectAll
// Purpose: Start every endpoint concurrently on the current executor and wait for all of them.
//==========================================================================================================
net::awaitable<void> MultiServerAuthBinder::connectAll() {
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (connecting || ready) {
            throw errors::ConfigurationError("connectAll() already ran; call closeAll() before reconnecting");
        }
        connecting = true;
        failures.clear();
    }
    const std::size_t n = endpoints.size();
    struct Outcome {
        std::unique_ptr<IEndpointSession> session;
        std::exception_ptr error;
    };
    auto outcomes = std::make_shared<std::vector<Outcome>>(n);
    auto remaining = std::make_shared<std::atomic<std::size_t>>(n);
    auto allDone = std::make_shared<async::AsyncResult<bool>>();

    auto ex = co_await net::this_coro::executor;
    for (std::size_t i = 0; i < n; ++i) {
        net::co_spawn(ex, connectOne(i),
            [outcomes, remaining, allDone, i](std::exception_ptr e, std::unique_ptr<IEndpointSession> s) {
                (*outcomes)[i].session = std::move(s);
                (*outcomes)[i].error = e;
                if (remaining->fetch_sub(1) == 1) {
                    allDone->setValue(true);
                }
            });
    }
    if (n > 0) {
        co_await allDone->wait(std::chrono::steady_clock::time_point::max());
    }

    std::vector<EndpointFailure> all;
    bool fatal = false;
    {
        std::lock_guard<std::mutex> lk(mtx);
        for (std::size_t i = 0; i < n; ++i) {
            Outcome& o = (*outcomes)[i];
            if (!o.error) {
                connected[i] = std::move(o.session);
                continue;
            }
            EndpointFailure f;
            f.index = i;
            f.endpoint = endpoints[i];
            f.kind = errors::errorKindOf(o.error);
            f.message = errors::describeException(o.error);
            f.error = o.error;
            const bool isolated = !opts.failFast || endpoints[i].optional;
            if (!isolated) {
                fatal = true;
            }
            all.push_back(std::move(f));
        }
        failures = all;
        connecting = false;
    }

    for (const auto& f : all) {
        const bool isolated = !opts.failFast || f.endpoint.optional;
        if (isolated) {
            LOG_WARN("Endpoint '{}' unavailable: {}", f.endpoint.name, f.message);
            if (opts.onConnectionError) {
                opts.onConnectionError(f.endpoint, f.error);
            }
        } else {
            LOG_ERROR("Required endpoint '{}' failed: {}", f.endpoint.name, f.message);
        }
    }

    if (fatal) {
        co_await closeAll();
        throw CompositeConnectError(all);
    }
    {
        std::lock_guard<std::mutex> lk(mtx);
        ready = true;
    }
    LOG_INFO("Connected {}/{} endpoints", n - all.size(), n);
}

net::awaitable<void> MultiServerAuthBinder::closeAll() {
    std::vector<std::pair<std::size_t, std::unique_ptr<IEndpointSession>>> toClose;
    {
        std::lock_guard<std::mutex> lk(mtx);
        for (std::size_t i = 0; i < connected.size(); ++i) {
            if (connected[i]) {
                toClose.emplace_back(i, std::move(connected[i]));
            }
        }
        ready = false;
    }
    for (auto& [index, session] : toClose) {
        try {
            co_await session->close();
        } catch (const std::exception& e) {
            LOG_WARN("Closing endpoint '{}' failed: {}", endpoints[index].name, e.what());
        }
    }
}

bool MultiServerAuthBinder::isReady() const {
    std::lock_guard<std::mutex> lk(mtx);
    return ready;
}

std::vector<IEndpointSession*> MultiServerAuthBinder::sessions() const {
    std::lock_guard<std::mutex> lk(mtx);
    std::vector<IEndpointSession*> out;
    out.reserve(connected.size());
    for (const auto& s : connected) {
        out.push_back(s.get());
    }
    return out;
}

std::vector<EndpointFailure> MultiServerAuthBinder::failedConnections() const {
    std::lock_guard<std::mutex> lk(mtx);
    return failures;
}

} // namespace mcpauth
