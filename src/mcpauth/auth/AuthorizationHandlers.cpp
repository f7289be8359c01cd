//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/AuthorizationHandlers.cpp
// Purpose: Console and embedder-driven authorization handlers
//==========================================================================================================

#include <condition_variable>
#include <fmt/format.h>
#include <iostream>
#include <sstream>
#include <thread>

#include "logging/Logger.h"
#include "mcpauth/auth/AuthorizationHandler.hpp"
#include "mcpauth/auth/UrlUtil.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth::auth {

using async::AsyncResult;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::chrono::milliseconds remainingMs(std::chrono::steady_clock::time_point from,
                                      std::chrono::steady_clock::time_point deadline) {
    if (deadline <= from) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - from);
}

} // namespace

AuthorizationCallback parseAuthorizationResponse(const std::string& input) {
    std::string text = trim(input);
    if (text.empty()) {
        throw errors::CallbackError("Empty authorization response");
    }
    const bool looksLikeQuery = text.find("://") != std::string::npos || text.front() == '?' ||
                                text.find("code=") != std::string::npos || text.find("error=") != std::string::npos;
    if (looksLikeQuery) {
        std::string query = text;
        std::size_t q = query.find('?');
        if (q != std::string::npos) {
            query = query.substr(q + 1);
        }
        std::size_t hash = query.find('#');
        if (hash != std::string::npos) {
            query = query.substr(0, hash);
        }
        auto params = parseQueryString(query);
        auto err = params.find("error");
        if (err != params.end()) {
            auto desc = params.find("error_description");
            std::string description = desc == params.end() ? std::string() : desc->second;
            throw errors::CancellationError(fmt::format("Authorization was not granted: {}", err->second),
                                            err->second, description);
        }
        auto code = params.find("code");
        if (code == params.end() || code->second.empty()) {
            throw errors::CallbackError("Authorization response does not contain a code");
        }
        AuthorizationCallback cb;
        cb.code = code->second;
        auto st = params.find("state");
        if (st != params.end()) {
            cb.state = st->second;
        }
        return cb;
    }

    std::istringstream iss(text);
    AuthorizationCallback cb;
    std::string state;
    iss >> cb.code;
    if (iss >> state) {
        cb.state = state;
    }
    return cb;
}

//==========================================================================================================
// ConsoleAuthorizationHandler
//==========================================================================================================

// Shared between the handler and its reader thread.
struct ConsoleAuthorizationHandler::Reader {
    std::mutex mtx;
    std::condition_variable cv;
    bool wantLine{false};
    bool reading{false};
    bool stopping{false};
    bool inputClosed{false};
    std::shared_ptr<AsyncResult<AuthorizationCallback>> pending;

    // Body of the reader thread: one getline per request, handed to the attempt pending at completion.
    static void run(std::shared_ptr<Reader> self, std::istream* input) {
        for (;;) {
            {
                std::unique_lock<std::mutex> lk(self->mtx);
                self->cv.wait(lk, [&self]() { return self->wantLine || self->stopping; });
                if (self->stopping) {
                    return;
                }
                self->reading = true;
            }
            std::string line;
            const bool ok = static_cast<bool>(std::getline(*input, line));
            std::shared_ptr<AsyncResult<AuthorizationCallback>> target;
            {
                std::lock_guard<std::mutex> lk(self->mtx);
                self->reading = false;
                self->wantLine = false;
                if (!ok) {
                    self->inputClosed = true;
                }
                target = self->pending;
            }
            if (!ok) {
                if (target) {
                    target->setException(std::make_exception_ptr(
                        errors::CancellationError("Authorization input closed before a code was entered")));
                }
                return;
            }
            if (!target) {
                LOG_DEBUG("Discarding console input received with no authorization attempt pending");
                continue;
            }
            try {
                target->setValue(parseAuthorizationResponse(line));
            } catch (const std::exception&) {
                target->setException(std::current_exception());
            }
        }
    }
};

ConsoleAuthorizationHandler::ConsoleAuthorizationHandler()
    : ConsoleAuthorizationHandler(std::cin, std::cout) {}

ConsoleAuthorizationHandler::ConsoleAuthorizationHandler(std::istream& inStream, std::ostream& outStream)
    : in(inStream), out(outStream), reader(std::make_shared<Reader>()) {}

ConsoleAuthorizationHandler::~ConsoleAuthorizationHandler() {
    bool blocked = false;
    {
        std::lock_guard<std::mutex> lk(reader->mtx);
        reader->stopping = true;
        blocked = reader->reading;
        reader->pending.reset();
    }
    reader->cv.notify_all();
    if (!readerThread.joinable()) {
        return;
    }
    if (blocked) {
        // A blocked getline cannot be interrupted.
        readerThread.detach();
    } else {
        readerThread.join();
    }
}

boost::asio::awaitable<void> ConsoleAuthorizationHandler::present(const std::string& authorizationUrl) {
    out << "Open the following URL in a browser to authorize this client:\n\n    "
        << authorizationUrl << "\n" << std::endl;
    co_return;
}

boost::asio::awaitable<AuthorizationCallback> ConsoleAuthorizationHandler::collect(
    std::chrono::steady_clock::time_point deadline) {
    auto slot = std::make_shared<AsyncResult<AuthorizationCallback>>();
    {
        std::lock_guard<std::mutex> lk(reader->mtx);
        if (reader->inputClosed) {
            throw errors::CancellationError("Authorization input is closed");
        }
        reader->pending = slot;
        reader->wantLine = true;
        if (!readerThread.joinable()) {
            readerThread = std::thread(&Reader::run, reader, &in);
        }
    }
    reader->cv.notify_one();
    out << "Paste the redirect URL (or the authorization code) and press Enter: " << std::flush;

    const auto started = std::chrono::steady_clock::now();
    bool done = co_await slot->wait(deadline);
    {
        std::lock_guard<std::mutex> lk(reader->mtx);
        if (reader->pending == slot) {
            reader->pending.reset();
            if (!reader->reading) {
                reader->wantLine = false;
            }
        }
    }
    if (!done) {
        slot->setException(std::make_exception_ptr(
            errors::TimeoutError("Timed out waiting for console input", remainingMs(started, deadline), "console")));
    }
    co_return slot->get();
}

void ConsoleAuthorizationHandler::cancel() {
    std::shared_ptr<AsyncResult<AuthorizationCallback>> slot;
    {
        std::lock_guard<std::mutex> lk(reader->mtx);
        slot = reader->pending;
    }
    if (slot) {
        slot->setException(std::make_exception_ptr(errors::CancellationError("Authorization cancelled by caller")));
    }
}

//==========================================================================================================
// ExternalAuthorizationHandler
//==========================================================================================================

ExternalAuthorizationHandler::ExternalAuthorizationHandler(UrlSink urlSink)
    : sink(std::move(urlSink)) {}

boost::asio::awaitable<void> ExternalAuthorizationHandler::present(const std::string& authorizationUrl) {
    {
        std::lock_guard<std::mutex> lk(mtx);
        lastUrl = authorizationUrl;
        pending = std::make_shared<AsyncResult<AuthorizationCallback>>();
        collected = false;
    }
    if (sink) {
        sink(authorizationUrl);
    } else {
        LOG_WARN("No URL sink configured; authorization URL: {}", authorizationUrl);
    }
    co_return;
}

boost::asio::awaitable<AuthorizationCallback> ExternalAuthorizationHandler::collect(
    std::chrono::steady_clock::time_point deadline) {
    std::shared_ptr<AsyncResult<AuthorizationCallback>> slot;
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (!pending || collected) {
            throw errors::CallbackError("No authorization attempt is awaiting a result; call present() first");
        }
        collected = true;
        slot = pending;
    }
    const auto started = std::chrono::steady_clock::now();
    if (!co_await slot->wait(deadline)) {
        slot->setException(std::make_exception_ptr(
            errors::TimeoutError("Timed out waiting for the authorization result", remainingMs(started, deadline), "external")));
    }
    co_return slot->get();
}

void ExternalAuthorizationHandler::cancel() {
    fail(std::make_exception_ptr(errors::CancellationError("Authorization cancelled by caller")));
}

std::shared_ptr<AsyncResult<AuthorizationCallback>> ExternalAuthorizationHandler::current() const {
    std::lock_guard<std::mutex> lk(mtx);
    return pending;
}

bool ExternalAuthorizationHandler::deliver(std::string code, std::optional<std::string> state) {
    auto slot = current();
    if (!slot) {
        return false;
    }
    return slot->setValue(AuthorizationCallback{std::move(code), std::move(state)});
}

bool ExternalAuthorizationHandler::deliverRedirectUrl(const std::string& redirectUrl) {
    AuthorizationCallback cb;
    try {
        cb = parseAuthorizationResponse(redirectUrl);
    } catch (const errors::OAuthError&) {
        return fail(std::current_exception());
    }
    return deliver(std::move(cb.code), std::move(cb.state));
}

bool ExternalAuthorizationHandler::fail(std::exception_ptr error) {
    auto slot = current();
    if (!slot) {
        return false;
    }
    return slot->setException(std::move(error));
}

std::string ExternalAuthorizationHandler::lastAuthorizationUrl() const {
    std::lock_guard<std::mutex> lk(mtx);
    return lastUrl;
}

} // namespace mcpauth::auth
