//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_authorization_handlers.cpp
// Purpose: Redirect parsing plus the console and embedder-driven authorization handlers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <istream>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>

#include <utility>
#include <boost/asio.hpp>

#include "StubAuthServer.h"
#include "mcpauth/auth/AuthorizationHandler.hpp"
#include "mcpauth/errors/Errors.h"

using namespace mcpauth;
using namespace mcpauth::auth;
namespace net = boost::asio;

namespace {

// Input that blocks like a terminal until text is fed or the stream is closed.
class TerminalBuf : public std::streambuf {
public:
    void feed(const std::string& text) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            queued += text;
        }
        cv.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx);
            closed = true;
        }
        cv.notify_all();
    }

protected:
    int_type underflow() override {
        std::unique_lock<std::mutex> lk(mtx);
        cv.wait(lk, [this]() { return !queued.empty() || closed; });
        if (queued.empty()) {
            return traits_type::eof();
        }
        current.swap(queued);
        queued.clear();
        setg(current.data(), current.data(), current.data() + current.size());
        return traits_type::to_int_type(current.front());
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::string queued;
    std::string current;
    bool closed{false};
};

} // namespace

TEST(ParseAuthorizationResponse, FullRedirectUrl) {
    auto cb = parseAuthorizationResponse("http://localhost:3030/callback?code=abc123&state=s%2B1#frag");
    EXPECT_EQ(cb.code, "abc123");
    ASSERT_TRUE(cb.state.has_value());
    EXPECT_EQ(*cb.state, "s+1");
}

TEST(ParseAuthorizationResponse, BareQueryAndCodeOnly) {
    auto q = parseAuthorizationResponse("  ?state=xyz&code=c1\n");
    EXPECT_EQ(q.code, "c1");
    EXPECT_EQ(q.state.value_or(""), "xyz");

    auto plain = parseAuthorizationResponse("c2 st2");
    EXPECT_EQ(plain.code, "c2");
    EXPECT_EQ(plain.state.value_or(""), "st2");

    auto codeOnly = parseAuthorizationResponse("c3");
    EXPECT_EQ(codeOnly.code, "c3");
    EXPECT_FALSE(codeOnly.state.has_value());
}

TEST(ParseAuthorizationResponse, ErrorsAndMissingCode) {
    try {
        parseAuthorizationResponse("http://localhost/cb?error=access_denied&error_description=nope");
        FAIL() << "expected CancellationError";
    } catch (const errors::CancellationError& e) {
        EXPECT_EQ(e.errorCode(), "access_denied");
        EXPECT_EQ(e.description(), "nope");
    }
    EXPECT_THROW(parseAuthorizationResponse("http://localhost/cb?state=only"), errors::CallbackError);
    EXPECT_THROW(parseAuthorizationResponse("   "), errors::CallbackError);
}

TEST(ExternalAuthorizationHandler, DeliverCompletesCollect) {
    std::string shown;
    ExternalAuthorizationHandler h([&shown](const std::string& url) { shown = url; });
    net::io_context io;
    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize?state=s1");
        EXPECT_TRUE(h.deliver("the-code", std::string("s1")));
        EXPECT_FALSE(h.deliver("second", std::string("s1")));
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(1));
    };
    auto cb = testutil::runAwaitable(io, flow());
    EXPECT_EQ(shown, "https://as.example.com/authorize?state=s1");
    EXPECT_EQ(h.lastAuthorizationUrl(), shown);
    EXPECT_EQ(cb.code, "the-code");
    EXPECT_EQ(cb.state.value_or(""), "s1");
}

TEST(ExternalAuthorizationHandler, DeliverFromAnotherThread) {
    ExternalAuthorizationHandler h(nullptr);
    net::io_context io;
    std::thread relay;
    auto flow = [&]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize");
        relay = std::thread([&h]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            h.deliverRedirectUrl("http://localhost:3030/callback?code=async-code&state=st");
        });
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    };
    auto cb = testutil::runAwaitable(io, flow());
    relay.join();
    EXPECT_EQ(cb.code, "async-code");
}

TEST(ExternalAuthorizationHandler, DeniedRedirectFailsAttempt) {
    ExternalAuthorizationHandler h(nullptr);
    net::io_context io;
    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize");
        EXPECT_TRUE(h.deliverRedirectUrl("http://localhost:3030/callback?error=access_denied"));
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(1));
    };
    EXPECT_THROW(testutil::runAwaitable(io, flow()), errors::CancellationError);
}

TEST(ExternalAuthorizationHandler, TimeoutAndCollectWithoutPresent) {
    ExternalAuthorizationHandler h(nullptr);
    net::io_context io;
    EXPECT_THROW(testutil::runAwaitable(io, h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(1))),
                 errors::CallbackError);
    EXPECT_FALSE(h.deliver("too-early", std::nullopt));

    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize");
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::milliseconds(100));
    };
    EXPECT_THROW(testutil::runAwaitable(io, flow()), errors::TimeoutError);
}

TEST(ExternalAuthorizationHandler, CancelAbortsCollect) {
    ExternalAuthorizationHandler h(nullptr);
    net::io_context io;
    net::steady_timer timer(io);
    timer.expires_after(std::chrono::milliseconds(50));
    timer.async_wait([&h](const boost::system::error_code&) { h.cancel(); });
    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize");
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(10));
    };
    EXPECT_THROW(testutil::runAwaitable(io, flow()), errors::CancellationError);
}

TEST(ConsoleAuthorizationHandler, ReadsPastedRedirect) {
    std::istringstream in("http://localhost:3030/callback?code=pasted&state=p1\n");
    std::ostringstream out;
    ConsoleAuthorizationHandler h(in, out);
    net::io_context io;
    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize?x=1");
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    };
    auto cb = testutil::runAwaitable(io, flow());
    EXPECT_EQ(cb.code, "pasted");
    EXPECT_EQ(cb.state.value_or(""), "p1");
    EXPECT_NE(out.str().find("https://as.example.com/authorize?x=1"), std::string::npos);
}

TEST(ConsoleAuthorizationHandler, ClosedInputIsCancellation) {
    std::istringstream in("");
    std::ostringstream out;
    ConsoleAuthorizationHandler h(in, out);
    net::io_context io;
    auto flow = [&h]() -> net::awaitable<AuthorizationCallback> {
        co_await h.present("https://as.example.com/authorize");
        co_return co_await h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    };
    EXPECT_THROW(testutil::runAwaitable(io, flow()), errors::CancellationError);
}

TEST(ConsoleAuthorizationHandler, RetryAfterTimeoutReceivesTheNextLine) {
    TerminalBuf terminal;
    std::istream in(&terminal);
    std::ostringstream out;
    {
        ConsoleAuthorizationHandler h(in, out);
        net::io_context io;
        EXPECT_THROW(testutil::runAwaitable(io, h.collect(std::chrono::steady_clock::now() + std::chrono::milliseconds(100))),
                     errors::TimeoutError);

        std::thread typist([&terminal]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            terminal.feed("code2 state2\n");
        });
        auto cb = testutil::runAwaitable(io, h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(2)));
        typist.join();
        EXPECT_EQ(cb.code, "code2");
        EXPECT_EQ(cb.state.value_or(""), "state2");
    }
    terminal.close();
}

TEST(ConsoleAuthorizationHandler, LineWithoutPendingAttemptIsDiscarded) {
    TerminalBuf terminal;
    std::istream in(&terminal);
    std::ostringstream out;
    {
        ConsoleAuthorizationHandler h(in, out);
        net::io_context io;
        EXPECT_THROW(testutil::runAwaitable(io, h.collect(std::chrono::steady_clock::now() + std::chrono::milliseconds(50))),
                     errors::TimeoutError);
        terminal.feed("stale-code s0\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        std::thread typist([&terminal]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            terminal.feed("fresh-code s1\n");
        });
        auto cb = testutil::runAwaitable(io, h.collect(std::chrono::steady_clock::now() + std::chrono::seconds(2)));
        typist.join();
        EXPECT_EQ(cb.code, "fresh-code");
    }
    terminal.close();
}
