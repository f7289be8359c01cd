//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_callback_listener.cpp
// Purpose: LocalCallbackListener serving real loopback redirects
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <utility>
#include <boost/asio.hpp>

#include "StubAuthServer.h"
#include "mcpauth/auth/LocalCallbackListener.hpp"
#include "mcpauth/errors/Errors.h"

using namespace mcpauth;
using namespace mcpauth::auth;
namespace net = boost::asio;

namespace {

struct ListenerFixture {
    unsigned short port{testutil::pickFreePort()};
    std::string base{std::string("http://127.0.0.1:") + std::to_string(port)};
    std::string redirect{base + "/callback"};

    LocalCallbackListener::Options options(std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
        LocalCallbackListener::Options o;
        o.redirectUri = redirect;
        o.timeout = timeout;
        o.openBrowser = false;
        return o;
    }
};

// present() then collect() as one coroutine.
net::awaitable<AuthorizationCallback> presentAndCollect(LocalCallbackListener& l, std::chrono::milliseconds budget) {
    co_await l.present("https://as.example.com/authorize?client_id=x");
    co_return co_await l.collect(std::chrono::steady_clock::now() + budget);
}

} // namespace

TEST(LocalCallbackListener, CapturesCodeAndState) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options());
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?code=abc123&state=xyz");
    });
    auto cb = testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
    EXPECT_EQ(cb.code, "abc123");
    ASSERT_TRUE(cb.state.has_value());
    EXPECT_EQ(*cb.state, "xyz");
    auto page = browser.get();
    EXPECT_EQ(page.status, 200);
    EXPECT_NE(page.body.find("Authorization Successful"), std::string::npos);
}

TEST(LocalCallbackListener, OtherPathsGet404AndDoNotComplete) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options());
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto favicon = testutil::blockingGet(fx.base + "/favicon.ico");
        auto redirect = testutil::blockingGet(fx.redirect + "?code=c2&state=s2");
        return std::make_pair(favicon, redirect);
    });
    auto cb = testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
    EXPECT_EQ(cb.code, "c2");
    auto pages = browser.get();
    EXPECT_EQ(pages.first.status, 404);
    EXPECT_EQ(pages.second.status, 200);
}

TEST(LocalCallbackListener, ErrorRedirectIsCancellation) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options());
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?error=access_denied&error_description=User%20said%20no");
    });
    try {
        testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
        FAIL() << "expected CancellationError";
    } catch (const errors::CancellationError& e) {
        EXPECT_EQ(e.errorCode(), "access_denied");
        EXPECT_EQ(e.description(), "User said no");
    }
    EXPECT_EQ(browser.get().status, 400);
}

TEST(LocalCallbackListener, MissingCodeIsCallbackError) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options());
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?state=only");
    });
    EXPECT_THROW(testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5))), errors::CallbackError);
    EXPECT_EQ(browser.get().status, 400);
}

TEST(LocalCallbackListener, TimeoutReleasesPortForRebind) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options(std::chrono::milliseconds(150)));
    net::io_context io;
    try {
        testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_EQ(e.timeout(), std::chrono::milliseconds(150));
    }

    // Same port can be bound again right away.
    LocalCallbackListener second(fx.options());
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?code=again&state=s");
    });
    auto cb = testutil::runAwaitable(io, presentAndCollect(second, std::chrono::seconds(5)));
    EXPECT_EQ(cb.code, "again");
    EXPECT_EQ(browser.get().status, 200);
}

TEST(LocalCallbackListener, DeadlineShorterThanTimeoutWins) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options(std::chrono::minutes(5)));
    net::io_context io;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(testutil::runAwaitable(io, presentAndCollect(l, std::chrono::milliseconds(150))), errors::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST(LocalCallbackListener, SingleUseUntilPresentedAgain) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options());
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?code=first&state=s");
    });
    (void)testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
    (void)browser.get();

    EXPECT_THROW(testutil::runAwaitable(io, l.collect(std::chrono::steady_clock::now() + std::chrono::seconds(1))),
                 errors::CallbackError);
    // Nothing listens once the redirect was served.
    EXPECT_FALSE(testutil::blockingGet(fx.redirect + "?code=late").error.empty());
}

TEST(LocalCallbackListener, CancelAbortsPendingCollect) {
    ListenerFixture fx;
    LocalCallbackListener l(fx.options(std::chrono::seconds(30)));
    net::io_context io;
    net::steady_timer timer(io);
    timer.expires_after(std::chrono::milliseconds(100));
    timer.async_wait([&l](const boost::system::error_code&) { l.cancel(); });
    EXPECT_THROW(testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(30))), errors::CancellationError);
}

TEST(LocalCallbackListener, PortInUseIsNetworkError) {
    ListenerFixture fx;
    net::io_context blockerIo;
    net::ip::tcp::acceptor blocker(blockerIo);
    net::ip::tcp::endpoint ep{net::ip::make_address("127.0.0.1"), fx.port};
    blocker.open(ep.protocol());
    blocker.bind(ep);
    blocker.listen();

    LocalCallbackListener l(fx.options());
    net::io_context io;
    EXPECT_THROW(testutil::runAwaitable(io, l.present("https://as.example.com/authorize")), errors::NetworkError);
}

TEST(LocalCallbackListener, InvalidPortIsConfigurationError) {
    LocalCallbackListener::Options o;
    o.redirectUri = "http://127.0.0.1:99999/callback";
    o.openBrowser = false;
    LocalCallbackListener l(o);
    net::io_context io;
    EXPECT_THROW(testutil::runAwaitable(io, l.present("https://as.example.com/authorize")), errors::ConfigurationError);
}

TEST(LocalCallbackListener, BrowserLaunchFailureIsNotFatal) {
    ListenerFixture fx;
    auto o = fx.options();
    o.openBrowser = true;
    auto launchedWith = std::make_shared<std::promise<std::string>>();
    auto launchedUrl = launchedWith->get_future();
    o.browserLauncher = [launchedWith](const std::string& url) {
        launchedWith->set_value(url);
        return false;
    };
    LocalCallbackListener l(o);
    net::io_context io;
    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?code=manual&state=s");
    });
    auto cb = testutil::runAwaitable(io, presentAndCollect(l, std::chrono::seconds(5)));
    EXPECT_EQ(cb.code, "manual");
    ASSERT_EQ(launchedUrl.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(launchedUrl.get(), "https://as.example.com/authorize?client_id=x");
    (void)browser.get();
}

TEST(LocalCallbackListener, SlowBrowserLauncherDoesNotBlockRedirect) {
    ListenerFixture fx;
    auto o = fx.options();
    o.openBrowser = true;
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> released = release->get_future().share();
    auto finished = std::make_shared<std::promise<void>>();
    auto launcherDone = finished->get_future();
    o.browserLauncher = [released, finished](const std::string&) {
        released.wait();
        finished->set_value();
        return true;
    };
    LocalCallbackListener l(o);
    net::io_context io;

    const auto start = std::chrono::steady_clock::now();
    testutil::runAwaitable(io, l.present("https://as.example.com/authorize?client_id=x"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    auto browser = std::async(std::launch::async, [&fx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return testutil::blockingGet(fx.redirect + "?code=while-launching&state=s");
    });
    auto cb = testutil::runAwaitable(io, l.collect(std::chrono::steady_clock::now() + std::chrono::seconds(5)));
    EXPECT_EQ(cb.code, "while-launching");
    EXPECT_EQ(browser.get().status, 200);

    release->set_value();
    EXPECT_EQ(launcherDone.wait_for(std::chrono::seconds(2)), std::future_status::ready);
}
