//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AsyncResult.h
// Purpose: Thread-safe one-shot completion that Boost.Asio coroutines can await with a deadline
//==========================================================================================================

#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpauth {
namespace async {

//==========================================================================================================
// AsyncResult<T>
// Purpose: Value-or-exception slot completed once (from any thread) and awaited by any number of coroutines.
// Notes:
//   - Waiters park on a steady_timer bound to their own executor; completion posts a cancel to each timer.
//   - Waiters are expected to run on a single-threaded executor (io_context with one I/O thread or a strand).
//==========================================================================================================
template <typename T>
class AsyncResult {
public:
    // Returns false when the result was already completed.
    bool setValue(T v) {
        std::vector<std::shared_ptr<boost::asio::steady_timer>> toWake;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (ready) {
                return false;
            }
            value.emplace(std::move(v));
            ready = true;
            toWake = takeWaiters();
        }
        wake(toWake);
        return true;
    }

    bool setException(std::exception_ptr e) {
        std::vector<std::shared_ptr<boost::asio::steady_timer>> toWake;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (ready) {
                return false;
            }
            error = std::move(e);
            ready = true;
            toWake = takeWaiters();
        }
        wake(toWake);
        return true;
    }

    bool isReady() const {
        std::lock_guard<std::mutex> lk(mtx);
        return ready;
    }

    // Returns the stored value or rethrows the stored exception. Requires isReady().
    T get() const {
        std::lock_guard<std::mutex> lk(mtx);
        if (error) {
            std::rethrow_exception(error);
        }
        return *value;
    }

    //==========================================================================================================
    // wait
    // Purpose: Suspend the calling coroutine until the result completes or the deadline passes.
    // Returns:
    //   true when completed; false when the deadline passed first.
    //==========================================================================================================
    boost::asio::awaitable<bool> wait(std::chrono::steady_clock::time_point deadline) {
        auto executor = co_await boost::asio::this_coro::executor;
        auto timer = std::make_shared<boost::asio::steady_timer>(executor);
        timer->expires_at(deadline);
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (ready) {
                co_return true;
            }
            waiters.push_back(timer);
        }
        boost::system::error_code ec;
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        std::lock_guard<std::mutex> lk(mtx);
        waiters.erase(std::remove_if(waiters.begin(), waiters.end(),
                                     [&timer](const std::weak_ptr<boost::asio::steady_timer>& w) {
                                         auto t = w.lock();
                                         return !t || t == timer;
                                     }),
                      waiters.end());
        co_return ready;
    }

private:
    std::vector<std::shared_ptr<boost::asio::steady_timer>> takeWaiters() {
        std::vector<std::shared_ptr<boost::asio::steady_timer>> out;
        for (auto& w : waiters) {
            if (auto t = w.lock()) {
                out.push_back(std::move(t));
            }
        }
        waiters.clear();
        return out;
    }

    static void wake(const std::vector<std::shared_ptr<boost::asio::steady_timer>>& timers) {
        for (const auto& t : timers) {
            boost::asio::post(t->get_executor(), [t]() { t->cancel(); });
        }
    }

    mutable std::mutex mtx;
    bool ready{false};
    std::optional<T> value;
    std::exception_ptr error;
    std::vector<std::weak_ptr<boost::asio::steady_timer>> waiters;
};

} // namespace async
} // namespace mcpauth
