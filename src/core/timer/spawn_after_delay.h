#pragma once

#include <asio/awaitable.hpp>
#include <asio/error_code.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <concepts>
#include <type_traits>

namespace core::timer {

// Returns false when the wait was aborted instead of expiring.
inline asio::awaitable<bool> sleep_for(std::chrono::steady_clock::duration delay) {
    asio::steady_timer timer(co_await asio::this_coro::executor, delay);
    asio::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    co_return !ec;
}

// The callable may return void or an awaitable.
template<typename Callable>
    requires std::invocable<Callable>
inline asio::awaitable<void> spawn_after_delay(Callable callable,
                                               std::chrono::steady_clock::duration delay) {
    if (!co_await sleep_for(delay)) {
        co_return;
    }
    if constexpr (std::is_void_v<std::invoke_result_t<Callable>>) {
        callable();
    } else {
        co_await callable();
    }
}

template<typename Awaitable>
    requires(!std::invocable<Awaitable>)
inline asio::awaitable<void> spawn_after_delay(Awaitable awaitable,
                                               std::chrono::steady_clock::duration delay) {
    if (!co_await sleep_for(delay)) {
        co_return;
    }
    co_await std::move(awaitable);
}
} // namespace core::timer
