#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <limits>

namespace sender {

enum class NetworkQuality { Excellent, Good, Fair, Poor };

const char* to_string(NetworkQuality quality);

struct NetworkMetrics {
    double current_rtt_ms = 0.0;
    double average_rtt_ms = 0.0;
    double min_rtt_ms = std::numeric_limits<double>::infinity();
    double max_rtt_ms = 0.0;
    std::size_t rtt_samples = 0;
    double jitter_ms = 0.0;

    // Bytes per second.
    double estimated_bandwidth = 0.0;
    double average_bandwidth = 0.0;
    double peak_bandwidth = 0.0;

    double average_buffer_level = 0.0;
    std::size_t buffer_full_count = 0;

    NetworkQuality quality = NetworkQuality::Fair;
};

struct MonitorConfig {
    std::size_t rtt_sample_size = 20;
    std::chrono::milliseconds bandwidth_window{10000};
    std::size_t min_bandwidth_samples = 5;
    double bandwidth_smoothing = 0.1;
    std::chrono::milliseconds buffer_window{30000};
    std::size_t buffer_full_threshold = 1024 * 1024;
};

// Sliding-window view of link conditions seen by one sender.
class NetworkMonitor {
  public:
    using Clock = std::chrono::steady_clock;

    explicit NetworkMonitor(MonitorConfig config = {})
        : config_(config) {}

    void update_rtt(double rtt_ms);
    void record_chunk_transfer(std::size_t bytes, Clock::time_point now = Clock::now());
    void record_buffer_level(std::size_t level, Clock::time_point now = Clock::now());
    // Reclassifies quality once both RTT and bandwidth have been observed.
    void update_quality();

    NetworkMetrics metrics() const { return metrics_; }
    void reset();

  private:
    struct Timed {
        Clock::time_point at;
        std::size_t value;
    };

    MonitorConfig config_;
    NetworkMetrics metrics_;
    std::deque<double> rtt_samples_;
    std::deque<Timed> chunk_timings_;
    std::deque<Timed> buffer_levels_;
};

} // namespace sender
