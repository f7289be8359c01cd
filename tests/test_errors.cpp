//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the OAuth failure hierarchy and exception classification helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

#include <utility>
#include <boost/asio/error.hpp>

#include "mcpauth/errors/Errors.h"

using namespace mcpauth::errors;

TEST(Errors, KindNames) {
    EXPECT_STREQ(errorKindToString(ErrorKind::Configuration), "configuration");
    EXPECT_STREQ(errorKindToString(ErrorKind::Timeout), "timeout");
    EXPECT_STREQ(errorKindToString(ErrorKind::Cancellation), "cancellation");
    EXPECT_STREQ(errorKindToString(ErrorKind::Network), "network");
    EXPECT_STREQ(errorKindToString(ErrorKind::Server), "server");
}

TEST(Errors, OAuthCodeMapping) {
    EXPECT_EQ(oauthErrorCodeFromString("invalid_grant"), OAuthErrorCode::InvalidGrant);
    EXPECT_EQ(oauthErrorCodeFromString("invalid_client"), OAuthErrorCode::InvalidClient);
    EXPECT_EQ(oauthErrorCodeFromString("access_denied"), OAuthErrorCode::AccessDenied);
    EXPECT_EQ(oauthErrorCodeFromString("invalid_client_metadata"), OAuthErrorCode::InvalidClientMetadata);
    EXPECT_EQ(oauthErrorCodeFromString("slow_down"), OAuthErrorCode::SlowDown);
    EXPECT_EQ(oauthErrorCodeFromString("http_502"), OAuthErrorCode::Unknown);
    EXPECT_EQ(oauthErrorCodeFromString(""), OAuthErrorCode::Unknown);
}

TEST(Errors, CallbackErrorIsConfiguration) {
    try {
        throw CallbackError("state mismatch", "callback");
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        EXPECT_EQ(e.context(), "callback");
        EXPECT_STREQ(e.what(), "state mismatch");
    }
}

TEST(Errors, TypedAccessors) {
    TimeoutError t("authorization timed out", std::chrono::milliseconds(1500));
    EXPECT_EQ(t.kind(), ErrorKind::Timeout);
    EXPECT_EQ(t.timeout(), std::chrono::milliseconds(1500));

    CancellationError c("user denied", "access_denied", "nope");
    EXPECT_EQ(c.kind(), ErrorKind::Cancellation);
    EXPECT_EQ(c.errorCode(), "access_denied");
    EXPECT_EQ(c.description(), "nope");

    NetworkError n("connect failed", boost::asio::error::connection_refused, "https://as/token");
    EXPECT_EQ(n.kind(), ErrorKind::Network);
    EXPECT_EQ(n.cause(), boost::asio::error::connection_refused);
    EXPECT_EQ(n.context(), "https://as/token");
}

TEST(Errors, ServerErrorMessage) {
    ServerError full("invalid_grant", "refresh token revoked", 400);
    EXPECT_STREQ(full.what(), "OAuth server error: invalid_grant (refresh token revoked) [HTTP 400]");
    EXPECT_EQ(full.oauthErrorCode(), OAuthErrorCode::InvalidGrant);
    EXPECT_EQ(full.httpStatus(), 400);

    ServerError bare("http_502", "", 0);
    EXPECT_STREQ(bare.what(), "OAuth server error: http_502");
    EXPECT_EQ(bare.oauthErrorCode(), OAuthErrorCode::Unknown);
}

TEST(Errors, ClassifyCapturedExceptions) {
    EXPECT_FALSE(errorKindOf(nullptr).has_value());
    EXPECT_EQ(describeException(nullptr), "");

    auto server = std::make_exception_ptr(ServerError("invalid_client", "", 401));
    EXPECT_EQ(errorKindOf(server), ErrorKind::Server);
    EXPECT_EQ(describeException(server), "server: OAuth server error: invalid_client [HTTP 401]");

    auto callback = std::make_exception_ptr(CallbackError("missing code"));
    EXPECT_EQ(errorKindOf(callback), ErrorKind::Configuration);

    auto plain = std::make_exception_ptr(std::logic_error("boom"));
    EXPECT_FALSE(errorKindOf(plain).has_value());
    EXPECT_EQ(describeException(plain), "boom");
}
