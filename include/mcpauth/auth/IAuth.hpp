//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/IAuth.hpp
// Purpose: Authentication provider interface consumed by HTTP connections to MCP endpoints
//==========================================================================================================
#pragma once

#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <boost/asio/awaitable.hpp>

namespace mcpauth::auth {

struct HeaderKV {
    std::string name;
    std::string value;
};

class IAuth {
public:
    virtual ~IAuth() = default;

    // Ensure credentials are ready (may register, run interactive authorization, exchange or refresh tokens)
    virtual boost::asio::awaitable<void> ensureReady() = 0;

    // Return headers to apply to an outgoing HTTP request
    virtual std::vector<HeaderKV> headers() const = 0;

    // Optional diagnostic sink
    virtual void setErrorHandler(std::function<void(const std::string&)> fn) = 0;
};

// Headers for an optional provider; empty when the endpoint is unauthenticated.
inline std::vector<HeaderKV> getAuthHeaders(const IAuth* auth) {
    if (!auth) {
        return {};
    }
    return auth->headers();
}

} // namespace mcpauth::auth
