#include "sender/network_monitor.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>

namespace sender {

namespace {
constexpr double kExcellentRtt = 50.0;
constexpr double kGoodRtt = 100.0;
constexpr double kFairRtt = 200.0;
constexpr double kExcellentBandwidth = 10.0 * 1024 * 1024;
constexpr double kGoodBandwidth = 5.0 * 1024 * 1024;
constexpr double kFairBandwidth = 1.0 * 1024 * 1024;
} // namespace

const char* to_string(NetworkQuality quality) {
    switch (quality) {
    case NetworkQuality::Excellent:
        return "excellent";
    case NetworkQuality::Good:
        return "good";
    case NetworkQuality::Fair:
        return "fair";
    case NetworkQuality::Poor:
        return "poor";
    }
    return "unknown";
}

void NetworkMonitor::update_rtt(double rtt_ms) {
    if (rtt_ms <= 0.0) {
        return;
    }
    rtt_samples_.push_back(rtt_ms);
    if (rtt_samples_.size() > config_.rtt_sample_size) {
        rtt_samples_.pop_front();
    }

    auto& m = metrics_;
    m.current_rtt_ms = rtt_ms;
    m.rtt_samples = rtt_samples_.size();
    m.min_rtt_ms = std::min(m.min_rtt_ms, rtt_ms);
    m.max_rtt_ms = std::max(m.max_rtt_ms, rtt_ms);
    m.average_rtt_ms = std::accumulate(rtt_samples_.begin(), rtt_samples_.end(), 0.0)
                       / static_cast<double>(rtt_samples_.size());

    if (rtt_samples_.size() > 1) {
        double variance = 0.0;
        for (const auto sample : rtt_samples_) {
            variance += (sample - m.average_rtt_ms) * (sample - m.average_rtt_ms);
        }
        m.jitter_ms = std::sqrt(variance / static_cast<double>(rtt_samples_.size()));
    }
}

void NetworkMonitor::record_chunk_transfer(std::size_t bytes, Clock::time_point now) {
    chunk_timings_.push_back({now, bytes});
    while (!chunk_timings_.empty() && now - chunk_timings_.front().at > config_.bandwidth_window) {
        chunk_timings_.pop_front();
    }
    if (chunk_timings_.size() < config_.min_bandwidth_samples) {
        return;
    }

    const auto span = std::chrono::duration<double>(now - chunk_timings_.front().at).count();
    if (span <= 0.0) {
        return;
    }
    std::size_t total = 0;
    for (const auto& t : chunk_timings_) {
        total += t.value;
    }
    const double current = static_cast<double>(total) / span;

    auto& m = metrics_;
    m.estimated_bandwidth = current;
    m.peak_bandwidth = std::max(m.peak_bandwidth, current);
    m.average_bandwidth = m.average_bandwidth == 0.0
                              ? current
                              : config_.bandwidth_smoothing * current
                                    + (1.0 - config_.bandwidth_smoothing) * m.average_bandwidth;
}

void NetworkMonitor::record_buffer_level(std::size_t level, Clock::time_point now) {
    buffer_levels_.push_back({now, level});
    while (!buffer_levels_.empty() && now - buffer_levels_.front().at > config_.buffer_window) {
        buffer_levels_.pop_front();
    }
    if (level >= config_.buffer_full_threshold) {
        ++metrics_.buffer_full_count;
    }
    double total = 0.0;
    for (const auto& b : buffer_levels_) {
        total += static_cast<double>(b.value);
    }
    metrics_.average_buffer_level = total / static_cast<double>(buffer_levels_.size());
}

void NetworkMonitor::update_quality() {
    auto& m = metrics_;
    if (m.rtt_samples == 0 || m.average_bandwidth <= 0.0) {
        return;
    }

    auto quality = NetworkQuality::Poor;
    if (m.average_rtt_ms <= kExcellentRtt && m.average_bandwidth >= kExcellentBandwidth) {
        quality = NetworkQuality::Excellent;
    } else if (m.average_rtt_ms <= kGoodRtt && m.average_bandwidth >= kGoodBandwidth) {
        quality = NetworkQuality::Good;
    } else if (m.average_rtt_ms <= kFairRtt && m.average_bandwidth >= kFairBandwidth) {
        quality = NetworkQuality::Fair;
    }

    if (quality != m.quality) {
        spdlog::debug("[NetworkMonitor::update_quality] {} -> {} (rtt {:.1f} ms, {:.2f} MiB/s)",
                      to_string(m.quality),
                      to_string(quality),
                      m.average_rtt_ms,
                      m.average_bandwidth / (1024.0 * 1024.0));
        m.quality = quality;
    }
}

void NetworkMonitor::reset() {
    metrics_ = NetworkMetrics{};
    rtt_samples_.clear();
    chunk_timings_.clear();
    buffer_levels_.clear();
}

} // namespace sender
