#include "sender/pacer.h"
#include "core/executor_fixture.h"
#include "core/fake_channel.h"
#include "core/loopback_channel.h"
#include <atomic>

using namespace std::chrono_literals;
using sender::PaceResult;
using sender::TransmissionPacer;

namespace {
util::PacingSettings fast_settings() {
    util::PacingSettings settings;
    settings.high_water_mark = 32 * 1024;
    settings.low_threshold = 8 * 1024;
    settings.wait_timeout_ms = 500;
    settings.drain_poll_ms = 5;
    settings.drain_timeout_ms = 150;
    return settings;
}
} // namespace

class PacerTest : public ExecutorTest {
  protected:
    TransmissionPacer pacer{executor.get_io_context().get_executor(), fast_settings()};
};

TEST_F(PacerTest, ThresholdsFollowPeerClass) {
    util::PacingSettings settings;
    settings.constrained_peer = true;
    TransmissionPacer constrained(executor.get_io_context().get_executor(), settings);
    EXPECT_EQ(constrained.high_water_mark(), settings.constrained_high_water_mark);
    EXPECT_EQ(constrained.low_threshold(), settings.constrained_low_threshold);
    EXPECT_EQ(pacer.high_water_mark(), 32u * 1024);
}

TEST_F(PacerTest, AttachInstallsLowThreshold) {
    test_utils::StuckChannel channel("peer");
    test_utils::on_io(executor, [&]() { pacer.attach(channel); });
    EXPECT_EQ(channel.buffered_amount_low_threshold(), 8u * 1024);
    EXPECT_TRUE(channel.has_drain_handler());

    test_utils::on_io(executor, [&]() { pacer.detach("peer"); });
    EXPECT_FALSE(channel.has_drain_handler());
}

TEST_F(PacerTest, ReadyBelowHighWaterMark) {
    test_utils::StuckChannel channel("peer", 1024);
    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(channel));
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::Ready);
}

TEST_F(PacerTest, CancelledBeforeWaiting) {
    test_utils::StuckChannel channel("peer", 64 * 1024);
    std::atomic<bool> cancelled{true};
    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(channel, &cancelled));
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::Cancelled);
}

TEST_F(PacerTest, ClosedChannelDoesNotBlock) {
    test_utils::StuckChannel channel("peer", 64 * 1024);
    channel.set_open(false);
    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(channel));
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::Ready);
}

TEST_F(PacerTest, WaitEndsWithinTimeoutWithoutDrainSignal) {
    test_utils::StuckChannel channel("peer", 64 * 1024);
    const auto start = std::chrono::steady_clock::now();
    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(channel));

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 450ms);
    EXPECT_EQ(pacer.timeouts(), 1u);
}

TEST_F(PacerTest, DrainSignalWakesWaiter) {
    test_utils::StuckChannel channel("peer", 64 * 1024);
    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(channel));
    EXPECT_EQ(future.wait_for(30ms), std::future_status::timeout);

    test_utils::on_io(executor, [&]() { channel.release(); });
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::Drained);
    EXPECT_EQ(pacer.timeouts(), 0u);
}

TEST_F(PacerTest, LoopbackBufferDrains) {
    core::LoopbackOptions options;
    options.bytes_per_tick = 8 * 1024;
    options.tick = std::chrono::milliseconds(5);
    auto [a, b] = core::LoopbackChannel::make_pair(executor.get_io_context(), "a", "b", options);
    b->on_message([](ConstDataBlock) {});

    const ByteBuffer message(8 * 1024, std::byte{7});
    test_utils::on_io(executor, [&, a = a]() {
        pacer.attach(*a);
        for (int i = 0; i < 12; ++i) {
            a->send(message);
        }
    });

    auto future = test_utils::spawn_future(executor, pacer.wait_for_backpressure(*a));
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(future.get(), PaceResult::Drained);
    EXPECT_LE(test_utils::on_io(executor, [a = a]() { return a->buffered_amount(); }), 8u * 1024);

    auto drained = test_utils::spawn_future(executor, pacer.drain(*a));
    ASSERT_EQ(drained.wait_for(1s), std::future_status::ready);
    EXPECT_TRUE(drained.get());
    test_utils::on_io(executor, [&]() { pacer.detach("b"); });
}

TEST_F(PacerTest, DrainGivesUpOnStuckChannel) {
    test_utils::StuckChannel channel("peer", 100);
    auto future = test_utils::spawn_future(executor, pacer.drain(channel));
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_FALSE(future.get());
}

TEST_F(PacerTest, DrainStopsOnCancel) {
    test_utils::StuckChannel channel("peer", 100);
    std::atomic<bool> cancelled{false};
    auto future = test_utils::spawn_future(executor, pacer.drain(channel, &cancelled));
    cancelled = true;
    ASSERT_EQ(future.wait_for(500ms), std::future_status::ready);
    EXPECT_FALSE(future.get());
}
