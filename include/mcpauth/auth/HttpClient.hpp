//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/HttpClient.hpp
// Purpose: One-shot HTTP/1.1 request coroutine (plain or TLS) used for OAuth discovery, registration and tokens
//==========================================================================================================
#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>

#include "mcpauth/async/AsyncResult.h"
#include "mcpauth/auth/IAuth.hpp"

namespace mcpauth::auth {

struct HttpRequestParams {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::string contentType;
    std::vector<HeaderKV> headers;
    std::string serverName;        // SNI override; defaults to the URL host
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
};

struct HttpResponse {
    int status{0};
    std::string body;
    std::unordered_map<std::string, std::string> headers; // lower-case names

    bool ok() const { return status >= 200 && status < 300; }
    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

using ErrorFn = std::function<void(const std::string&)>;

//==========================================================================================================
// resolveWithin
// Purpose: Host name resolution bounded by a deadline. The resolver is cancelled when the deadline wins; a
//          late completion is dropped.
// Throws:
//   boost::system::system_error with boost::beast::error::timeout on expiry, or the resolver's error.
//==========================================================================================================
template <typename Resolver>
boost::asio::awaitable<typename Resolver::results_type> resolveWithin(std::shared_ptr<Resolver> resolver,
                                                                      const std::string& host,
                                                                      const std::string& port,
                                                                      std::chrono::milliseconds timeout) {
    using Results = typename Resolver::results_type;
    auto resolved = std::make_shared<async::AsyncResult<Results>>();
    resolver->async_resolve(host, port, [resolver, resolved](const boost::system::error_code& ec, Results results) {
        if (ec) {
            resolved->setException(std::make_exception_ptr(boost::system::system_error(ec)));
        } else {
            resolved->setValue(std::move(results));
        }
    });
    if (!co_await resolved->wait(std::chrono::steady_clock::now() + timeout)) {
        resolver->cancel();
        throw boost::system::system_error(boost::beast::error::timeout);
    }
    co_return resolved->get();
}

//==========================================================================================================
// coHttpRequest
// Purpose: Resolve, connect (TLS 1.3 for https), send one request and read the full response.
// Args:
//   params: Request description and timeouts.
//   sslCtxOpt: Optional caller-owned TLS context; a verifying TLS 1.3 client context is created when null.
//   debugSink: Optional diagnostic sink for step-by-step tracing.
// Returns:
//   The HTTP response, whatever its status code.
// Throws:
//   errors::TimeoutError when the resolve/connect or read deadline elapses.
//   errors::NetworkError for resolution, connection, TLS or protocol failures.
//==========================================================================================================
boost::asio::awaitable<HttpResponse> coHttpRequest(
    const HttpRequestParams& params,
    boost::asio::ssl::context* sslCtxOpt = nullptr,
    ErrorFn debugSink = ErrorFn());

// POST application/x-www-form-urlencoded convenience wrapper over coHttpRequest.
boost::asio::awaitable<HttpResponse> coPostFormUrlencoded(
    HttpRequestParams params,
    const std::string& body,
    boost::asio::ssl::context* sslCtxOpt = nullptr,
    ErrorFn debugSink = ErrorFn());

} // namespace mcpauth::auth
