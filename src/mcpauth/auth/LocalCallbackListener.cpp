//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/LocalCallbackListener.cpp
// Purpose: Boost.Beast loopback server for the OAuth authorization redirect
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpauth/auth/LocalCallbackListener.hpp"
#include "mcpauth/auth/UrlUtil.hpp"
#include "mcpauth/errors/Errors.h"

namespace mcpauth::auth {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::seconds kRequestReadLimit{10};

struct CallbackOutcome {
    bool matched{false};
    AuthorizationCallback callback;
    std::string error;
    std::string errorDescription;
};

std::string htmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string page(const std::string& title, const std::string& message) {
    return fmt::format(
        "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>{0}</title></head>"
        "<body style=\"font-family:sans-serif;text-align:center;margin-top:4em\">"
        "<h1>{0}</h1><p>{1}</p></body></html>",
        htmlEscape(title), htmlEscape(message));
}

// Reads one request from an accepted connection and answers it.
net::awaitable<CallbackOutcome> serveRedirect(tcp::socket socket,
                                              const std::string& expectedPath,
                                              std::chrono::steady_clock::time_point deadline) {
    CallbackOutcome outcome;
    boost::beast::tcp_stream stream(std::move(socket));
    stream.expires_at(std::min(deadline, std::chrono::steady_clock::now() + kRequestReadLimit));
    boost::beast::flat_buffer buffer;
    http::request<http::string_body> req;
    boost::system::error_code ec;
    co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        LOG_DEBUG("Ignoring unreadable callback connection: {}", ec.message());
        co_return outcome;
    }

    auto rawTarget = req.target();
    UrlParts target = parseUrl(std::string(rawTarget.data(), rawTarget.size()));

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(false);

    if (req.method() != http::verb::get || target.path != expectedPath) {
        res.result(http::status::not_found);
        res.body() = page("Not Found", "This address only serves the OAuth redirect.");
    } else {
        auto params = parseQueryString(target.query);
        outcome.matched = true;
        auto code = params.find("code");
        auto error = params.find("error");
        if (code != params.end() && !code->second.empty()) {
            outcome.callback.code = code->second;
            auto state = params.find("state");
            if (state != params.end()) {
                outcome.callback.state = state->second;
            }
            res.body() = page("Authorization Successful", "You can close this window and return to the application.");
        } else if (error != params.end()) {
            outcome.error = error->second;
            auto desc = params.find("error_description");
            if (desc != params.end()) {
                outcome.errorDescription = desc->second;
            }
            res.result(http::status::bad_request);
            res.body() = page("Authorization Failed",
                              outcome.errorDescription.empty() ? outcome.error
                                                               : outcome.error + std::string(": ") + outcome.errorDescription);
        } else {
            res.result(http::status::bad_request);
            res.body() = page("Authorization Failed", "The redirect did not include an authorization code.");
        }
    }
    res.prepare_payload();
    co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        LOG_DEBUG("Callback response write failed: {}", ec.message());
    }
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    co_return outcome;
}

} // namespace

struct LocalCallbackListener::State {
    std::mutex mtx;
    std::optional<net::any_io_executor> executor;
    std::unique_ptr<tcp::acceptor> acceptor; // touched only on `executor`
    std::atomic<bool> cancelled{false};
    std::atomic<bool> timedOut{false};
    bool consumed{false};

    void closeAcceptor() {
        if (acceptor && acceptor->is_open()) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
    }

    void bind(const net::any_io_executor& ex, const std::string& redirectUri) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            executor = ex;
        }
        closeAcceptor();
        acceptor.reset();

        UrlParts u = parseUrl(redirectUri);
        if (u.port.empty() || !std::all_of(u.port.begin(), u.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }) ||
            u.port.size() > 5 || std::stoul(u.port) > 65535ul) {
            throw errors::ConfigurationError(fmt::format("Invalid callback port '{}'", u.port), redirectUri);
        }
        boost::system::error_code ec;
        tcp::resolver resolver(ex);
        auto results = resolver.resolve(u.host, u.port, ec);
        if (ec || results.empty()) {
            throw errors::NetworkError(fmt::format("Cannot resolve callback host '{}'", u.host), ec, redirectUri);
        }
        tcp::endpoint ep = results.begin()->endpoint();
        for (const auto& r : results) {
            if (r.endpoint().address().is_v4()) {
                ep = r.endpoint();
                break;
            }
        }

        auto acc = std::make_unique<tcp::acceptor>(ex);
        acc->open(ep.protocol(), ec);
        if (!ec) acc->set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acc->bind(ep, ec);
        if (!ec) acc->listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw errors::NetworkError(fmt::format("Cannot listen for the OAuth callback on {}:{}: {}", u.host, u.port, ec.message()),
                                       ec, redirectUri);
        }
        acceptor = std::move(acc);
        cancelled = false;
        timedOut = false;
        consumed = false;
    }
};

namespace {

// Releases the socket and marks the listener consumed however collect() ends.
struct AttemptGuard {
    std::function<void()> release;
    ~AttemptGuard() { release(); }
};

} // namespace

LocalCallbackListener::LocalCallbackListener()
    : LocalCallbackListener(Options()) {}

LocalCallbackListener::LocalCallbackListener(Options options)
    : opts(std::move(options)), st(std::make_shared<State>()) {}

LocalCallbackListener::~LocalCallbackListener() = default;

boost::asio::awaitable<void> LocalCallbackListener::present(const std::string& authorizationUrl) {
    auto ex = co_await net::this_coro::executor;
    st->bind(ex, opts.redirectUri);
    LOG_INFO("Waiting for the OAuth redirect on {}", opts.redirectUri);

    if (!opts.openBrowser) {
        LOG_INFO("Open this URL to authorize: {}", authorizationUrl);
        co_return;
    }
    // Launched off the I/O thread; present() does not wait for the launcher.
    std::function<bool(const std::string&)> launcher = opts.browserLauncher
        ? opts.browserLauncher
        : std::function<bool(const std::string&)>(&LocalCallbackListener::launchSystemBrowser);
    std::thread([launcher = std::move(launcher), url = authorizationUrl]() {
        bool launched = false;
        try {
            launched = launcher(url);
        } catch (const std::exception& e) {
            LOG_WARN("Browser launcher threw: {}", e.what());
        }
        if (!launched) {
            LOG_WARN("Could not open a browser; open this URL manually: {}", url);
        }
    }).detach();
    co_return;
}

boost::asio::awaitable<AuthorizationCallback> LocalCallbackListener::collect(
    std::chrono::steady_clock::time_point deadline) {
    auto ex = co_await net::this_coro::executor;
    auto s = st;
    if (s->consumed) {
        throw errors::CallbackError("Callback listener already served a redirect; start a new authorization attempt",
                                    opts.redirectUri);
    }
    if (!s->acceptor) {
        s->bind(ex, opts.redirectUri);
    }

    const auto now = std::chrono::steady_clock::now();
    const auto effective = std::min(deadline, now + opts.timeout);
    const auto timeoutMs = std::max(std::chrono::milliseconds(0),
                                    std::chrono::duration_cast<std::chrono::milliseconds>(effective - now));
    auto timer = std::make_shared<net::steady_timer>(ex);
    timer->expires_at(effective);
    timer->async_wait([s](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        s->timedOut = true;
        s->closeAcceptor();
    });
    AttemptGuard guard{[s, timer]() {
        timer->cancel();
        s->closeAcceptor();
        s->acceptor.reset();
        s->consumed = true;
    }};

    const std::string expectedPath = parseUrl(opts.redirectUri).path;
    for (;;) {
        if (s->cancelled) {
            throw errors::CancellationError("Authorization cancelled by caller", std::string(), std::string(), opts.redirectUri);
        }
        boost::system::error_code ec;
        tcp::socket socket = co_await s->acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (s->timedOut) {
                throw errors::TimeoutError(fmt::format("No OAuth redirect received on {} within {} ms", opts.redirectUri, timeoutMs.count()),
                                           timeoutMs, opts.redirectUri);
            }
            if (s->cancelled) {
                throw errors::CancellationError("Authorization cancelled by caller", std::string(), std::string(), opts.redirectUri);
            }
            throw errors::NetworkError("Callback listener accept failed", ec, opts.redirectUri);
        }
        CallbackOutcome outcome = co_await serveRedirect(std::move(socket), expectedPath, effective);
        if (!outcome.matched) {
            continue;
        }
        if (!outcome.error.empty()) {
            throw errors::CancellationError(fmt::format("Authorization was not granted: {}", outcome.error),
                                            outcome.error, outcome.errorDescription, opts.redirectUri);
        }
        if (outcome.callback.code.empty()) {
            throw errors::CallbackError("OAuth redirect did not include an authorization code", opts.redirectUri);
        }
        LOG_INFO("OAuth redirect received on {}", opts.redirectUri);
        co_return outcome.callback;
    }
}

void LocalCallbackListener::cancel() {
    auto s = st;
    s->cancelled = true;
    std::optional<net::any_io_executor> ex;
    {
        std::lock_guard<std::mutex> lk(s->mtx);
        ex = s->executor;
    }
    if (ex) {
        net::post(*ex, [s]() { s->closeAcceptor(); });
    }
}

bool LocalCallbackListener::launchSystemBrowser(const std::string& url) {
#ifdef _WIN32
    std::string cmd = std::string("start \"\" \"") + url + std::string("\"");
#else
    std::string quoted;
    quoted.reserve(url.size() + 2);
    quoted.push_back('\'');
    for (char c : url) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
#  ifdef __APPLE__
    std::string cmd = std::string("open ") + quoted + std::string(" >/dev/null 2>&1");
#  else
    std::string cmd = std::string("xdg-open ") + quoted + std::string(" >/dev/null 2>&1");
#  endif
#endif
    return std::system(cmd.c_str()) == 0;
}

} // namespace mcpauth::auth
