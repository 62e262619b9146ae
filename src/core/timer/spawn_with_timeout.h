#pragma once

#include "core/timer/spawn_after_delay.h"
#include <asio/awaitable.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>

namespace core::timer {

using namespace asio::experimental::awaitable_operators;

// Races the task against a timer. The loser is cancelled.
template<typename Awaitable>
    requires(!std::is_void_v<typename Awaitable::value_type>)
inline auto spawn_with_timeout(Awaitable task, std::chrono::steady_clock::duration timeout)
    -> asio::awaitable<std::optional<typename Awaitable::value_type>> {
    using T = typename Awaitable::value_type;

    auto expire = [](std::chrono::steady_clock::duration after) -> asio::awaitable<std::optional<T>> {
        co_await sleep_for(after);
        co_return std::nullopt;
    };
    auto run = [](Awaitable inner) -> asio::awaitable<std::optional<T>> {
        co_return co_await std::move(inner);
    };

    auto result = co_await (expire(timeout) || run(std::move(task)));
    co_return result.index() == 0 ? std::get<0>(result) : std::get<1>(result);
}

// void tasks report true on completion and false on timeout.
template<typename Awaitable>
    requires(std::is_void_v<typename Awaitable::value_type>)
inline auto spawn_with_timeout(Awaitable task, std::chrono::steady_clock::duration timeout)
    -> asio::awaitable<bool> {
    auto expire = [](std::chrono::steady_clock::duration after) -> asio::awaitable<bool> {
        co_await sleep_for(after);
        co_return false;
    };
    auto run = [](Awaitable inner) -> asio::awaitable<bool> {
        co_await std::move(inner);
        co_return true;
    };

    auto result = co_await (expire(timeout) || run(std::move(task)));
    co_return result.index() == 0 ? std::get<0>(result) : std::get<1>(result);
}
} // namespace core::timer
