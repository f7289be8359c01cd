//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/ApiKeyAuth.hpp
// Purpose: Static API key header provider implementing IAuth
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpauth/auth/IAuth.hpp"

namespace mcpauth::auth {

// Sends a fixed header such as "X-API-Key: <key>" with every request.
class ApiKeyAuth final : public IAuth {
public:
    ApiKeyAuth(std::string headerName, std::string headerValue)
        : name(std::move(headerName)), val(std::move(headerValue)) {}

    boost::asio::awaitable<void> ensureReady() override {
        co_return;
    }

    std::vector<HeaderKV> headers() const override {
        return { HeaderKV{ name, val } };
    }

    void setErrorHandler(std::function<void(const std::string&)> fn) override {
        (void)fn;
    }

    const std::string& headerName() const { return name; }

private:
    std::string name;
    std::string val;
};

using ApiKeyAuthPtr = std::shared_ptr<ApiKeyAuth>;

} // namespace mcpauth::auth
