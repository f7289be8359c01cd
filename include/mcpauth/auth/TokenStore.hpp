//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/TokenStore.hpp
// Purpose: Persistence boundary for client credentials and token sets
//==========================================================================================================
#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "mcpauth/auth/OAuthTypes.hpp"

namespace mcpauth::auth {

//==========================================================================================================
// ITokenStore
// Purpose: Holds at most one ClientCredentials and one TokenSet for a single authorization server.
// Notes:
//   - Implementations must be safe to call from the I/O thread and from the owner's thread concurrently.
//   - setTokens replaces the whole TokenSet; there are no partial updates.
//   - Credentials are never cleared by the provider; clearTokens leaves them in place.
//==========================================================================================================
class ITokenStore {
public:
    virtual ~ITokenStore() = default;

    virtual std::optional<ClientCredentials> getClientCredentials() const = 0;
    virtual void setClientCredentials(const ClientCredentials& credentials) = 0;

    virtual std::optional<TokenSet> getTokens() const = 0;
    virtual void setTokens(const TokenSet& tokens) = 0;
    virtual void clearTokens() = 0;
};

// Process-memory store. Pre-seeded credentials model a client registered out of band.
class InMemoryTokenStore final : public ITokenStore {
public:
    InMemoryTokenStore() = default;
    explicit InMemoryTokenStore(ClientCredentials preRegistered,
                                std::optional<TokenSet> initialTokens = std::nullopt)
        : credentials(std::move(preRegistered)), tokens(std::move(initialTokens)) {}

    std::optional<ClientCredentials> getClientCredentials() const override {
        std::lock_guard<std::mutex> lk(mtx);
        return credentials;
    }

    void setClientCredentials(const ClientCredentials& c) override {
        std::lock_guard<std::mutex> lk(mtx);
        credentials = c;
    }

    std::optional<TokenSet> getTokens() const override {
        std::lock_guard<std::mutex> lk(mtx);
        return tokens;
    }

    void setTokens(const TokenSet& t) override {
        std::lock_guard<std::mutex> lk(mtx);
        tokens = t;
    }

    void clearTokens() override {
        std::lock_guard<std::mutex> lk(mtx);
        tokens.reset();
    }

private:
    mutable std::mutex mtx;
    std::optional<ClientCredentials> credentials;
    std::optional<TokenSet> tokens;
};

using TokenStorePtr = std::shared_ptr<ITokenStore>;

} // namespace mcpauth::auth
