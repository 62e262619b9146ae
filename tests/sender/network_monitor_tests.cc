#include "sender/network_monitor.h"
#include "gtest/gtest.h"

using namespace std::chrono_literals;
using sender::NetworkMonitor;
using sender::NetworkQuality;

namespace {
constexpr std::size_t kMiB = 1024 * 1024;

// Feeds n chunks of the given size spaced evenly so the window holds
// bytes_per_second of throughput.
void feed_bandwidth(NetworkMonitor& monitor, std::size_t chunk, std::chrono::milliseconds spacing, int n) {
    auto now = NetworkMonitor::Clock::now();
    for (int i = 0; i < n; ++i) {
        monitor.record_chunk_transfer(chunk, now);
        now += spacing;
    }
}
} // namespace

TEST(NetworkMonitorTest, RttStatistics) {
    NetworkMonitor monitor;
    monitor.update_rtt(10.0);
    monitor.update_rtt(30.0);
    monitor.update_rtt(0.0);

    const auto m = monitor.metrics();
    EXPECT_EQ(m.rtt_samples, 2u);
    EXPECT_DOUBLE_EQ(m.current_rtt_ms, 30.0);
    EXPECT_DOUBLE_EQ(m.average_rtt_ms, 20.0);
    EXPECT_DOUBLE_EQ(m.min_rtt_ms, 10.0);
    EXPECT_DOUBLE_EQ(m.max_rtt_ms, 30.0);
    EXPECT_DOUBLE_EQ(m.jitter_ms, 10.0);
}

TEST(NetworkMonitorTest, RttWindowIsBounded) {
    sender::MonitorConfig config;
    config.rtt_sample_size = 3;
    NetworkMonitor monitor(config);
    for (double rtt : {100.0, 100.0, 100.0, 10.0, 10.0, 10.0}) {
        monitor.update_rtt(rtt);
    }
    EXPECT_EQ(monitor.metrics().rtt_samples, 3u);
    EXPECT_DOUBLE_EQ(monitor.metrics().average_rtt_ms, 10.0);
}

TEST(NetworkMonitorTest, BandwidthNeedsMinimumSamples) {
    NetworkMonitor monitor;
    feed_bandwidth(monitor, 64 * 1024, 10ms, 4);
    EXPECT_DOUBLE_EQ(monitor.metrics().estimated_bandwidth, 0.0);

    feed_bandwidth(monitor, 64 * 1024, 10ms, 6);
    EXPECT_GT(monitor.metrics().estimated_bandwidth, 0.0);
    EXPECT_GE(monitor.metrics().peak_bandwidth, monitor.metrics().estimated_bandwidth);
}

TEST(NetworkMonitorTest, BufferLevels) {
    sender::MonitorConfig config;
    config.buffer_full_threshold = 1000;
    NetworkMonitor monitor(config);
    monitor.record_buffer_level(200);
    monitor.record_buffer_level(1200);

    EXPECT_DOUBLE_EQ(monitor.metrics().average_buffer_level, 700.0);
    EXPECT_EQ(monitor.metrics().buffer_full_count, 1u);
}

TEST(NetworkMonitorTest, QualityNeedsBothSignals) {
    NetworkMonitor monitor;
    monitor.update_rtt(20.0);
    monitor.update_quality();
    EXPECT_EQ(monitor.metrics().quality, NetworkQuality::Fair);
}

TEST(NetworkMonitorTest, ExcellentAndPoorClassification) {
    NetworkMonitor fast;
    fast.update_rtt(20.0);
    // 1 MiB every 10 ms, about 100 MiB/s
    feed_bandwidth(fast, kMiB, 10ms, 10);
    fast.update_quality();
    EXPECT_EQ(fast.metrics().quality, NetworkQuality::Excellent);

    NetworkMonitor slow;
    slow.update_rtt(500.0);
    feed_bandwidth(slow, 1024, 100ms, 10);
    slow.update_quality();
    EXPECT_EQ(slow.metrics().quality, NetworkQuality::Poor);
}

TEST(NetworkMonitorTest, Reset) {
    NetworkMonitor monitor;
    monitor.update_rtt(20.0);
    monitor.record_buffer_level(10);
    monitor.reset();
    EXPECT_EQ(monitor.metrics().rtt_samples, 0u);
    EXPECT_DOUBLE_EQ(monitor.metrics().average_buffer_level, 0.0);
}
