#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/error_code.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <memory>

namespace core::timer {

// One-shot wakeup built on a timer that never expires on its own.
// notify() releases every current waiter; reset() re-arms it.
class Signal {
  public:
    explicit Signal(const asio::any_io_executor& executor)
        : timer_(std::make_shared<asio::steady_timer>(executor)) {
        timer_->expires_at(asio::steady_timer::time_point::max());
    }

    void notify() {
        notified_ = true;
        timer_->cancel();
    }

    void reset() {
        notified_ = false;
        timer_->expires_at(asio::steady_timer::time_point::max());
    }

    bool notified() const { return notified_; }

    asio::awaitable<void> wait() {
        if (notified_) {
            co_return;
        }
        auto timer = timer_;
        asio::error_code ec;
        co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

  private:
    std::shared_ptr<asio::steady_timer> timer_;
    bool notified_ = false;
};
} // namespace core::timer
