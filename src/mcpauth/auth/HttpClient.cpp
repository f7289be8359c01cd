//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/HttpClient.cpp
// Purpose: Boost.Beast implementation of the OAuth HTTP client
//==========================================================================================================

#include <string>
#include <utility>
#include <memory>
#include <chrono>
#include <fmt/format.h>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include "logging/Logger.h"
#include "mcpauth/auth/HttpClient.hpp"
#include "mcpauth/auth/UrlUtil.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::unique_ptr<ssl::context> makeClientContext(const HttpRequestParams& params, const ErrorFn& debugSink) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    boost::system::error_code ec;
    if (!params.caFile.empty()) {
        ctx->load_verify_file(params.caFile, ec);
    } else if (!params.caPath.empty()) {
        ctx->add_verify_path(params.caPath, ec);
    } else {
        ctx->set_default_verify_paths(ec);
    }
    if (ec && debugSink) {
        debugSink(std::string("HTTP DEBUG: trust store setup failed: ") + ec.message());
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

http::request<http::string_body> buildRequest(const HttpRequestParams& params, const UrlParts& u, const std::string& host) {
    http::verb verb = http::string_to_verb(params.method);
    if (verb == http::verb::unknown) {
        throw errors::ConfigurationError(fmt::format("Unsupported HTTP method '{}'", params.method), params.url);
    }
    http::request<http::string_body> req{verb, u.target(), 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    for (const auto& h : params.headers) {
        req.set(h.name, h.value);
    }
    if (!params.body.empty() || verb == http::verb::post) {
        if (!params.contentType.empty()) {
            req.set(http::field::content_type, params.contentType);
        }
        req.body() = params.body;
        req.prepare_payload();
    }
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.body = std::move(res.body());
    for (const auto& field : res) {
        auto rawName = field.name_string();
        auto rawValue = field.value();
        std::string name(rawName.data(), rawName.size());
        for (auto& c : name) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        out.headers[name] = std::string(rawValue.data(), rawValue.size());
    }
    return out;
}

template <typename Stream>
net::awaitable<HttpResponse> exchange(Stream& stream, boost::beast::tcp_stream& lowest,
                                      http::request<http::string_body>& req,
                                      const HttpRequestParams& params, const ErrorFn& debugSink) {
    lowest.expires_after(std::chrono::milliseconds(params.readTimeoutMs));
    co_await http::async_write(stream, req, net::use_awaitable);
    if (debugSink) {
        debugSink(std::string("HTTP DEBUG: wrote ") + params.method + std::string(" ") + params.url);
    }
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    if (debugSink) {
        debugSink(std::string("HTTP DEBUG: read status=") + std::to_string(res.result_int()) +
                  std::string(" bytes=") + std::to_string(res.body().size()));
    }
    co_return toResponse(res);
}

} // namespace

net::awaitable<HttpResponse> coHttpRequest(
    const HttpRequestParams& params,
    ssl::context* sslCtxOpt,
    ErrorFn debugSink) {
    UrlParts u = parseUrl(params.url);
    if (u.scheme != "http" && u.scheme != "https") {
        throw errors::ConfigurationError(fmt::format("Unsupported URL scheme '{}'", u.scheme), params.url);
    }
    unsigned int phaseTimeoutMs = params.connectTimeoutMs;
    try {
        auto executor = co_await net::this_coro::executor;
        auto results = co_await resolveWithin(std::make_shared<tcp::resolver>(executor), u.host, u.port,
                                              std::chrono::milliseconds(params.connectTimeoutMs));
        if (debugSink) {
            debugSink(std::string("HTTP DEBUG: resolved ") + u.host + std::string(":") + u.port + std::string(" path=") + u.path);
        }

        if (u.scheme == std::string("https")) {
            ssl::context* ctxPtr = sslCtxOpt;
            std::unique_ptr<ssl::context> localCtx;
            if (!ctxPtr) {
                localCtx = makeClientContext(params, debugSink);
                ctxPtr = localCtx.get();
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, *ctxPtr);
            std::string sni = params.serverName.empty() ? u.serverName : params.serverName;
            if (!sni.empty()) {
                if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                    throw errors::NetworkError("Failed to set TLS SNI host name",
                                               boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                                               params.url);
                }
                (void)::SSL_set1_host(stream.native_handle(), sni.c_str());
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            if (debugSink) {
                debugSink("HTTP DEBUG: https handshake complete");
            }
            auto req = buildRequest(params, u, sni);
            phaseTimeoutMs = params.readTimeoutMs;
            HttpResponse out = co_await exchange(stream, stream.next_layer(), req, params, debugSink);
            boost::system::error_code ec;
            stream.next_layer().expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            co_return out;
        } else {
            boost::beast::tcp_stream stream(executor);
            stream.expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            if (debugSink) {
                debugSink("HTTP DEBUG: http connected");
            }
            auto req = buildRequest(params, u, u.host);
            phaseTimeoutMs = params.readTimeoutMs;
            HttpResponse out = co_await exchange(stream, stream, req, params, debugSink);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return out;
        }
    } catch (const boost::system::system_error& e) {
        if (debugSink) {
            debugSink(std::string("HTTP coHttpRequest failed: ") + e.what());
        }
        if (e.code() == boost::beast::error::timeout) {
            throw errors::TimeoutError(fmt::format("HTTP {} {} timed out", params.method, params.url),
                                       std::chrono::milliseconds(phaseTimeoutMs), params.url);
        }
        throw errors::NetworkError(fmt::format("HTTP {} {} failed: {}", params.method, params.url, e.code().message()),
                                   e.code(), params.url);
    }
}

net::awaitable<HttpResponse> coPostFormUrlencoded(
    HttpRequestParams params,
    const std::string& body,
    ssl::context* sslCtxOpt,
    ErrorFn debugSink) {
    params.method = "POST";
    params.contentType = "application/x-www-form-urlencoded";
    params.body = body;
    co_return co_await coHttpRequest(params, sslCtxOpt, std::move(debugSink));
}

} // namespace mcpauth::auth
