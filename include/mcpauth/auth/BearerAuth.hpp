//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/BearerAuth.hpp
// Purpose: Static bearer token provider implementing IAuth
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

class BearerAuth final : public IAuth {
public:
    explicit BearerAuth(std::string token) : token(std::move(token)) {}

    boost::asio::awaitable<void> ensureReady() override {
        co_return;
    }

    // Always "Authorization: Bearer <token>", also for an empty token.
    std::vector<HeaderKV> headers() const override {
        return { HeaderKV{ "Authorization", std::string("Bearer ") + token } };
    }

    void setErrorHandler(std::function<void(const std::string&)> fn) override {
        (void)fn; // nothing can fail
    }

    const std::string& value() const { return token; }

private:
    std::string token;
};

using BearerAuthPtr = std::shared_ptr<BearerAuth>;

} // namespace mcpauth::auth
