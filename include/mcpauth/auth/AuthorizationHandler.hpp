//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/AuthorizationHandler.hpp
// Purpose: Pluggable strategy that shows the authorization URL to a user and collects the redirect result
//==========================================================================================================
#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpauth/async/AsyncResult.h"

namespace mcpauth::auth {

// Result of an authorization redirect.
struct AuthorizationCallback {
    std::string code;
    std::optional<std::string> state;
};

//==========================================================================================================
// IAuthorizationHandler
// Purpose: Presentation and collection halves of an interactive authorization.
// Notes:
//   - present() runs once per attempt, before collect().
//   - collect() must finish by `deadline` with a result, errors::TimeoutError, or errors::CancellationError.
//   - cancel() may be called from any thread and aborts a pending collect() with errors::CancellationError.
//==========================================================================================================
class IAuthorizationHandler {
public:
    virtual ~IAuthorizationHandler() = default;

    virtual boost::asio::awaitable<void> present(const std::string& authorizationUrl) = 0;
    virtual boost::asio::awaitable<AuthorizationCallback> collect(std::chrono::steady_clock::time_point deadline) = 0;
    virtual void cancel() = 0;
};

using AuthorizationHandlerPtr = std::shared_ptr<IAuthorizationHandler>;

//==========================================================================================================
// parseAuthorizationResponse
// Purpose: Interpret what a user pasted or an embedder received: a full redirect URL, a bare query string,
//          or "<code> [state]".
// Throws:
//   errors::CancellationError when the response carries an OAuth `error` (e.g., access_denied).
//   errors::CallbackError when no code can be found.
//==========================================================================================================
AuthorizationCallback parseAuthorizationResponse(const std::string& input);

//==========================================================================================================
// ConsoleAuthorizationHandler
// Purpose: Prints the URL and reads the redirect URL (or the code) from a text stream.
// Notes:
//   - One reader thread per handler performs every blocking read; a line goes to whichever attempt is
//     pending when it arrives, and a line arriving with no pending attempt is discarded.
//   - At most one read is outstanding; a retried collect() reuses the read left over from a timed-out one.
//   - The destructor joins an idle reader. A reader still blocked in a read is detached and exits on the
//     next line or end of input, so the input stream must outlive the handler in that case.
//==========================================================================================================
class ConsoleAuthorizationHandler final : public IAuthorizationHandler {
public:
    ConsoleAuthorizationHandler();
    ConsoleAuthorizationHandler(std::istream& in, std::ostream& out);
    ~ConsoleAuthorizationHandler() override;

    ConsoleAuthorizationHandler(const ConsoleAuthorizationHandler&) = delete;
    ConsoleAuthorizationHandler& operator=(const ConsoleAuthorizationHandler&) = delete;

    boost::asio::awaitable<void> present(const std::string& authorizationUrl) override;
    boost::asio::awaitable<AuthorizationCallback> collect(std::chrono::steady_clock::time_point deadline) override;
    void cancel() override;

private:
    struct Reader;

    std::istream& in;
    std::ostream& out;
    std::shared_ptr<Reader> reader;
    std::thread readerThread;
};

//==========================================================================================================
// ExternalAuthorizationHandler
// Purpose: Hands the URL to an embedding application (GUI, web view, device flow relay) and waits until the
//          application delivers the redirect result.
// Notes:
//   - deliver*/fail are thread-safe and complete the current attempt exactly once; later calls return false.
//==========================================================================================================
class ExternalAuthorizationHandler final : public IAuthorizationHandler {
public:
    using UrlSink = std::function<void(const std::string&)>;

    explicit ExternalAuthorizationHandler(UrlSink sink);

    boost::asio::awaitable<void> present(const std::string& authorizationUrl) override;
    boost::asio::awaitable<AuthorizationCallback> collect(std::chrono::steady_clock::time_point deadline) override;
    void cancel() override;

    bool deliver(std::string code, std::optional<std::string> state);
    // Parses with parseAuthorizationResponse; an error response fails the attempt.
    bool deliverRedirectUrl(const std::string& redirectUrl);
    bool fail(std::exception_ptr error);

    std::string lastAuthorizationUrl() const;

private:
    std::shared_ptr<async::AsyncResult<AuthorizationCallback>> current() const;

    UrlSink sink;
    mutable std::mutex mtx;
    std::string lastUrl;
    std::shared_ptr<async::AsyncResult<AuthorizationCallback>> pending;
    bool collected{false};
};

} // namespace mcpauth::auth
