#include "core/timer/signal.h"
#include "core/timer/spawn_after_delay.h"
#include "timer_test_fixture.h"
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <chrono>
#include <future>

using namespace std::chrono_literals;

TEST_F(TimerTest, SleepForExpires) {
    auto start = std::chrono::steady_clock::now();
    auto future = test_utils::spawn_future(executor, core::timer::sleep_for(50ms));

    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(TimerTest, SpawnAfterDelayWithCallable) {
    std::promise<void> done;
    auto future = done.get_future();
    auto start = std::chrono::steady_clock::now();

    executor.spawn([&done, start]() -> asio::awaitable<void> {
        co_await core::timer::spawn_after_delay(
            [&done, start]() {
                auto elapsed = std::chrono::steady_clock::now() - start;
                EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
                done.set_value();
            },
            100ms);
    });

    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
}

TEST_F(TimerTest, SpawnAfterDelayWithAwaitable) {
    std::promise<int> result_promise;
    auto future = result_promise.get_future();

    executor.spawn([&result_promise]() -> asio::awaitable<void> {
        auto task = [&result_promise]() -> asio::awaitable<void> {
            result_promise.set_value(42);
            co_return;
        };
        co_await core::timer::spawn_after_delay(task(), 50ms);
    });

    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_EQ(future.get(), 42);
}

TEST_F(TimerTest, NestedDelaysRunInOrder) {
    std::promise<std::string> result_promise;
    auto future = result_promise.get_future();

    executor.spawn([&result_promise]() -> asio::awaitable<void> {
        std::string result = "start";
        co_await core::timer::spawn_after_delay(
            [&result]() -> asio::awaitable<void> {
                result += "-outer";
                co_await core::timer::spawn_after_delay([&result]() { result += "-inner"; }, 20ms);
            },
            20ms);
        result_promise.set_value(result);
    });

    ASSERT_EQ(future.wait_for(1000ms), std::future_status::ready);
    EXPECT_EQ(future.get(), "start-outer-inner");
}

TEST_F(TimerTest, SignalReleasesWaiter) {
    core::timer::Signal signal(executor.get_io_context().get_executor());
    std::promise<void> woke;
    auto future = woke.get_future();

    executor.spawn([&]() -> asio::awaitable<void> {
        co_await signal.wait();
        woke.set_value();
    });
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);

    test_utils::on_io(executor, [&]() { signal.notify(); });
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
}

TEST_F(TimerTest, NotifiedSignalDoesNotBlockUntilReset) {
    core::timer::Signal signal(executor.get_io_context().get_executor());
    test_utils::on_io(executor, [&]() { signal.notify(); });

    auto first = test_utils::spawn_future(executor, signal.wait());
    ASSERT_EQ(first.wait_for(200ms), std::future_status::ready);

    test_utils::on_io(executor, [&]() { signal.reset(); });
    EXPECT_FALSE(signal.notified());
    auto second = test_utils::spawn_future(executor, signal.wait());
    EXPECT_EQ(second.wait_for(50ms), std::future_status::timeout);

    test_utils::on_io(executor, [&]() { signal.notify(); });
    EXPECT_EQ(second.wait_for(500ms), std::future_status::ready);
}
