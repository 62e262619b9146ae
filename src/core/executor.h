#pragma once

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace core {

// Protocol state lives on the single io_context thread. The thread pool only
// runs blocking work handed over through offload().
class Executor {
  public:
    Executor()
        : Executor(std::thread::hardware_concurrency()) {}

    explicit Executor(size_t thread_count)
        : concurrency_(thread_count > 0 ? thread_count : 1)
        , thread_pool_(concurrency_)
        , io_context_()
        , work_guard_() {}

    ~Executor() {
        if (running_.load()) {
            stop();
        }
    }

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    asio::io_context& get_io_context() { return io_context_; }
    asio::thread_pool& get_thread_pool() { return thread_pool_; }
    size_t get_thread_count() const { return concurrency_; }

    enum class Context { IO, ThreadPool };

    template<typename Awaitable>
    auto spawn(Awaitable&& awaitable, Context ctx = Context::IO) {
        if (ctx == Context::IO) {
            return asio::co_spawn(io_context_, std::forward<Awaitable>(awaitable), asio::detached);
        } else {
            return asio::co_spawn(thread_pool_, std::forward<Awaitable>(awaitable), asio::detached);
        }
    }

    template<typename Awaitable, typename CompletionToken>
    auto spawn(Awaitable&& awaitable, CompletionToken&& token, Context ctx = Context::IO) {
        if (ctx == Context::IO) {
            return asio::co_spawn(io_context_,
                                  std::forward<Awaitable>(awaitable),
                                  std::forward<CompletionToken>(token));
        } else {
            return asio::co_spawn(thread_pool_,
                                  std::forward<Awaitable>(awaitable),
                                  std::forward<CompletionToken>(token));
        }
    }

    // Runs a blocking callable on the thread pool and resumes the awaiting
    // coroutine on its own executor with the result.
    template<typename Callable, typename Result = std::invoke_result_t<Callable>>
        requires(!std::is_void_v<Result>)
    asio::awaitable<Result> offload(Callable callable) {
        co_return co_await asio::co_spawn(
            thread_pool_,
            [fn = std::move(callable)]() mutable -> asio::awaitable<Result> { co_return fn(); },
            asio::use_awaitable);
    }

  private:
    size_t concurrency_;
    asio::thread_pool thread_pool_;
    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_{};
    std::atomic<bool> running_{false};
};
} // namespace core
