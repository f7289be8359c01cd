//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed OAuth client failures (configuration, timeout, cancellation, network, server) and helpers
//==========================================================================================================

#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/system/error_code.hpp>

namespace mcpauth {
namespace errors {

// Coarse failure classes surfaced to callers.
enum class ErrorKind {
    Configuration,
    Timeout,
    Cancellation,
    Network,
    Server
};

// Standard OAuth 2.0 / RFC 7591 error codes reported by authorization servers.
enum class OAuthErrorCode {
    InvalidRequest,
    InvalidClient,
    InvalidGrant,
    UnauthorizedClient,
    UnsupportedGrantType,
    InvalidScope,
    AccessDenied,
    TemporarilyUnavailable,
    ServerError,
    SlowDown,
    InvalidRedirectUri,
    InvalidClientMetadata,
    Unknown
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancellation: return "cancellation";
        case ErrorKind::Network: return "network";
        case ErrorKind::Server: return "server";
    }
    return "unknown";
}

// Map a wire error code (e.g., "invalid_grant") to OAuthErrorCode.
//
// Args:
//   code: The `error` member of an OAuth error response.
//
// Returns:
//   OAuthErrorCode corresponding to the code, or Unknown when unmapped.
inline OAuthErrorCode oauthErrorCodeFromString(const std::string& code) {
    if (code == "invalid_request") return OAuthErrorCode::InvalidRequest;
    if (code == "invalid_client") return OAuthErrorCode::InvalidClient;
    if (code == "invalid_grant") return OAuthErrorCode::InvalidGrant;
    if (code == "unauthorized_client") return OAuthErrorCode::UnauthorizedClient;
    if (code == "unsupported_grant_type") return OAuthErrorCode::UnsupportedGrantType;
    if (code == "invalid_scope") return OAuthErrorCode::InvalidScope;
    if (code == "access_denied") return OAuthErrorCode::AccessDenied;
    if (code == "temporarily_unavailable") return OAuthErrorCode::TemporarilyUnavailable;
    if (code == "server_error") return OAuthErrorCode::ServerError;
    if (code == "slow_down") return OAuthErrorCode::SlowDown;
    if (code == "invalid_redirect_uri") return OAuthErrorCode::InvalidRedirectUri;
    if (code == "invalid_client_metadata") return OAuthErrorCode::InvalidClientMetadata;
    return OAuthErrorCode::Unknown;
}

//==========================================================================================================
// OAuthError
// Purpose: Root of the OAuth client failure hierarchy.
// Fields:
//   kind: Failure class used by callers to decide on retry.
//   context: Endpoint or component the failure relates to (may be empty).
//==========================================================================================================
class OAuthError : public std::runtime_error {
public:
    OAuthError(ErrorKind kind, const std::string& message, std::string context = std::string())
        : std::runtime_error(message), errKind(kind), ctx(std::move(context)) {}

    ErrorKind kind() const noexcept { return errKind; }
    const std::string& context() const noexcept { return ctx; }

private:
    ErrorKind errKind;
    std::string ctx;
};

// Malformed metadata, structurally rejected registration, missing redirect URI. Never retried.
class ConfigurationError : public OAuthError {
public:
    explicit ConfigurationError(const std::string& message, std::string context = std::string())
        : OAuthError(ErrorKind::Configuration, message, std::move(context)) {}
};

// Callback that cannot be trusted: state mismatch, missing code, reused listener.
class CallbackError : public ConfigurationError {
public:
    explicit CallbackError(const std::string& message, std::string context = std::string())
        : ConfigurationError(message, std::move(context)) {}
};

// A bounded wait exceeded its deadline.
class TimeoutError : public OAuthError {
public:
    TimeoutError(const std::string& message, std::chrono::milliseconds timeout, std::string context = std::string())
        : OAuthError(ErrorKind::Timeout, message, std::move(context)), timeoutMs(timeout) {}

    std::chrono::milliseconds timeout() const noexcept { return timeoutMs; }

private:
    std::chrono::milliseconds timeoutMs;
};

// The authorizing party declined, or the caller aborted the flow.
class CancellationError : public OAuthError {
public:
    CancellationError(const std::string& message,
                      std::string errorCode = std::string(),
                      std::string errorDescription = std::string(),
                      std::string context = std::string())
        : OAuthError(ErrorKind::Cancellation, message, std::move(context)),
          code(std::move(errorCode)),
          desc(std::move(errorDescription)) {}

    const std::string& errorCode() const noexcept { return code; }
    const std::string& description() const noexcept { return desc; }

private:
    std::string code;
    std::string desc;
};

// Transport-level failure reaching an OAuth endpoint.
class NetworkError : public OAuthError {
public:
    NetworkError(const std::string& message, boost::system::error_code cause, std::string context = std::string())
        : OAuthError(ErrorKind::Network, message, std::move(context)), ec(cause) {}

    const boost::system::error_code& cause() const noexcept { return ec; }

private:
    boost::system::error_code ec;
};

// Protocol-level error response from the authorization server.
class ServerError : public OAuthError {
public:
    ServerError(std::string errorCode,
                std::string errorDescription,
                int httpStatus,
                std::string context = std::string())
        : OAuthError(ErrorKind::Server, formatMessage(errorCode, errorDescription, httpStatus), std::move(context)),
          code(std::move(errorCode)),
          desc(std::move(errorDescription)),
          status(httpStatus) {}

    const std::string& errorCode() const noexcept { return code; }
    const std::string& description() const noexcept { return desc; }
    int httpStatus() const noexcept { return status; }
    OAuthErrorCode oauthErrorCode() const { return oauthErrorCodeFromString(code); }

private:
    static std::string formatMessage(const std::string& c, const std::string& d, int s) {
        std::string m = std::string("OAuth server error: ") + c;
        if (!d.empty()) {
            m += std::string(" (") + d + std::string(")");
        }
        if (s != 0) {
            m += std::string(" [HTTP ") + std::to_string(s) + std::string("]");
        }
        return m;
    }

    std::string code;
    std::string desc;
    int status{0};
};

// Extract the ErrorKind of a captured exception. Returns std::nullopt for non-OAuth exceptions.
inline std::optional<ErrorKind> errorKindOf(const std::exception_ptr& ep) {
    if (!ep) {
        return std::nullopt;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const OAuthError& e) {
        return e.kind();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Human readable one-liner for a captured exception (used for logs and composite errors).
inline std::string describeException(const std::exception_ptr& ep) {
    if (!ep) {
        return std::string();
    }
    try {
        std::rethrow_exception(ep);
    } catch (const OAuthError& e) {
        return std::string(errorKindToString(e.kind())) + std::string(": ") + e.what();
    } catch (const std::exception& e) {
        return e.what();
    }
}

} // namespace errors
} // namespace mcpauth
