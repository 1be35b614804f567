#pragma once

#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <concepts>

namespace core::timer {

template<typename Callable>
    requires std::invocable<Callable>
inline boost::asio::awaitable<void> spawn_after_delay(Callable&& callable, int delay_ms) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                    std::chrono::milliseconds(delay_ms));
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (!ec) {
        co_await callable();
    }
}

template<typename Awaitable>
    requires(!std::invocable<Awaitable>)
inline boost::asio::awaitable<void> spawn_after_delay(Awaitable&& awaitable, int delay_ms) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                    std::chrono::milliseconds(delay_ms));
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (!ec) {
        co_await std::forward<Awaitable>(awaitable);
    }
}
} // namespace core::timer
