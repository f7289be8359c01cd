//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/MultiServerAuthBinder.hpp
// Purpose: Connect several MCP endpoints concurrently, each with its own (optional) auth provider
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpauth/auth/IAuth.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth {

struct EndpointDescriptor {
    std::string name;
    std::string url;
    bool optional{false}; // failure is logged and isolated even when failFast is on
};

// An established connection to one endpoint.
class IEndpointSession {
public:
    virtual ~IEndpointSession() = default;
    virtual boost::asio::awaitable<void> close() = 0;
};

//==========================================================================================================
// IEndpointConnector
// Purpose: Opens a session to an endpoint using headers from the (possibly null) auth provider.
// Notes:
//   - The binder calls auth->ensureReady() before connect(); connect() only needs auth->headers().
//==========================================================================================================
class IEndpointConnector {
public:
    virtual ~IEndpointConnector() = default;
    virtual boost::asio::awaitable<std::unique_ptr<IEndpointSession>> connect(
        const EndpointDescriptor& endpoint, std::shared_ptr<auth::IAuth> auth) = 0;
};

struct EndpointFailure {
    std::size_t index{0};
    EndpointDescriptor endpoint;
    std::optional<errors::ErrorKind> kind;
    std::string message;
    std::exception_ptr error;
};

// Thrown by connectAll() when a required endpoint failed under failFast.
class CompositeConnectError : public std::runtime_error {
public:
    explicit CompositeConnectError(std::vector<EndpointFailure> failures);
    const std::vector<EndpointFailure>& failures() const noexcept { return items; }

private:
    static std::string summarize(const std::vector<EndpointFailure>& failures);
    std::vector<EndpointFailure> items;
};

struct BinderOptions {
    bool failFast{true};
    // Invoked for each isolated failure (optional endpoint, or failFast off).
    std::function<void(const EndpointDescriptor&, std::exception_ptr)> onConnectionError;
};

//==========================================================================================================
// MultiServerAuthBinder
// Purpose: Pairs endpoint i with auth provider i and connects all endpoints concurrently.
// Notes:
//   - An empty provider list means every endpoint is unauthenticated; otherwise the sizes must match.
//   - Providers are independent: one endpoint's OAuth flow never blocks another's.
//   - closeAll() must run before destruction to close sessions gracefully.
//==========================================================================================================
class MultiServerAuthBinder {
public:
    MultiServerAuthBinder(std::vector<EndpointDescriptor> endpoints,
                          std::vector<std::shared_ptr<auth::IAuth>> authProviders,
                          std::shared_ptr<IEndpointConnector> connector,
                          BinderOptions options = BinderOptions());
    ~MultiServerAuthBinder();

    MultiServerAuthBinder(const MultiServerAuthBinder&) = delete;
    MultiServerAuthBinder& operator=(const MultiServerAuthBinder&) = delete;

    // Throws CompositeConnectError (failFast and a required endpoint failed), after closing what connected.
    boost::asio::awaitable<void> connectAll();
    boost::asio::awaitable<void> closeAll();

    bool isReady() const;
    std::size_t size() const { return endpoints.size(); }
    const std::vector<EndpointDescriptor>& descriptors() const { return endpoints; }

    // Session per endpoint index; nullptr where not connected.
    std::vector<IEndpointSession*> sessions() const;
    std::vector<EndpointFailure> failedConnections() const;

private:
    boost::asio::awaitable<std::unique_ptr<IEndpointSession>> connectOne(std::size_t index);

    std::vector<EndpointDescriptor> endpoints;
    std::vector<std::shared_ptr<auth::IAuth>> auths;
    std::shared_ptr<IEndpointConnector> connector;
    BinderOptions opts;

    mutable std::mutex mtx;
    std::vector<std::unique_ptr<IEndpointSession>> connected;
    std::vector<EndpointFailure> failures;
    bool ready{false};
    bool connecting{false};
};

} // namespace mcpauth
