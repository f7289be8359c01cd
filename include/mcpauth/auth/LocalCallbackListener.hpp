//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/LocalCallbackListener.hpp
// Purpose: Loopback HTTP listener that captures the authorization redirect (default handler)
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpauth/auth/AuthorizationHandler.hpp"

namespace mcpauth::auth {

//==========================================================================================================
// LocalCallbackListener
// Purpose: Opens the system browser on the authorization URL and serves exactly one redirect on the
//          redirect URI's host/port/path.
// Notes:
//   - The socket is bound in present() so the redirect cannot race the listener.
//   - The browser launch runs off the I/O thread; present() returns once the socket is bound.
//   - Requests for other paths get 404 and do not complete the attempt.
//   - The socket is released when collect() finishes (success, error, timeout or cancel); a consumed
//     listener needs a new present() before it can collect again.
//==========================================================================================================
class LocalCallbackListener final : public IAuthorizationHandler {
public:
    struct Options {
        std::string redirectUri{"http://localhost:3030/callback"};
        std::chrono::milliseconds timeout{std::chrono::minutes(5)};
        bool openBrowser{true};
        // Returns false when the browser could not be launched. Defaults to launchSystemBrowser.
        // Invoked on a detached thread; present() does not wait for it and it must own what it captures.
        std::function<bool(const std::string&)> browserLauncher;
    };

    LocalCallbackListener();
    explicit LocalCallbackListener(Options options);
    ~LocalCallbackListener() override;

    LocalCallbackListener(const LocalCallbackListener&) = delete;
    LocalCallbackListener& operator=(const LocalCallbackListener&) = delete;

    boost::asio::awaitable<void> present(const std::string& authorizationUrl) override;
    boost::asio::awaitable<AuthorizationCallback> collect(std::chrono::steady_clock::time_point deadline) override;
    void cancel() override;

    const Options& options() const { return opts; }

    // xdg-open / open / start, depending on the platform.
    static bool launchSystemBrowser(const std::string& url);

private:
    struct State;

    Options opts;
    std::shared_ptr<State> st;
};

} // namespace mcpauth::auth
