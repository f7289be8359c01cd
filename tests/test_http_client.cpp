//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_client.cpp
// Purpose: Deadline handling of host name resolution in the HTTP client
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio.hpp>

#include "mcpauth/auth/HttpClient.hpp"
#include "StubAuthServer.h"

using namespace mcpauth::auth;
using tcp = boost::asio::ip::tcp;

namespace {

// Resolver whose lookups never complete until cancelled.
class StalledResolver {
public:
    using results_type = tcp::resolver::results_type;
    using Handler = std::function<void(const boost::system::error_code&, results_type)>;

    void async_resolve(const std::string& host, const std::string& port, Handler h) {
        requestedHost = host;
        requestedPort = port;
        pending = std::move(h);
    }
    void cancel() {
        ++cancelCount;
        pending = nullptr;
    }

    std::string requestedHost;
    std::string requestedPort;
    Handler pending;
    int cancelCount{0};
};

} // namespace

TEST(HttpClientResolve, StalledLookupTimesOutAndCancelsResolver) {
    boost::asio::io_context io;
    auto resolver = std::make_shared<StalledResolver>();

    const auto start = std::chrono::steady_clock::now();
    try {
        (void)testutil::runAwaitable(io, resolveWithin(resolver, "auth.example.invalid", "443",
                                                       std::chrono::milliseconds(300)));
        FAIL() << "expected timeout";
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), boost::system::error_code(boost::beast::error::timeout));
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(resolver->requestedHost, "auth.example.invalid");
    EXPECT_EQ(resolver->requestedPort, "443");
    EXPECT_EQ(resolver->cancelCount, 1);
    EXPECT_FALSE(resolver->pending);
}

TEST(HttpClientResolve, LoopbackLiteralResolvesWithinDeadline) {
    boost::asio::io_context io;
    auto resolver = std::make_shared<tcp::resolver>(io);
    auto results = testutil::runAwaitable(io, resolveWithin(resolver, "127.0.0.1", "8080",
                                                            std::chrono::milliseconds(2000)));
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.begin()->endpoint().port(), 8080);
    EXPECT_TRUE(results.begin()->endpoint().address().is_loopback());
}
