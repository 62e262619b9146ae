#pragma once

#include "sender/network_monitor.h"
#include "util/settings.h"
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace sender {

struct ChunkRecommendation {
    std::size_t chunk_size = 0;
    std::string reasoning;
    double confidence = 0.5;
    NetworkQuality quality = NetworkQuality::Fair;
    double adaptation_factor = 1.0;
};

enum class Trend { Increasing, Decreasing, Stable };

struct PlannerStats {
    std::size_t current_chunk_size = 0;
    std::size_t max_chunk_size = 0;
    std::size_t adaptation_count = 0;
    std::size_t oversize_reductions = 0;
    Trend trend = Trend::Stable;
    std::size_t stability_counter = 0;
};

// Chooses the payload size of the next chunk. Adjustments apply to chunks
// not yet sent, except reduce_for_oversize() which the sender uses to retry
// the chunk the channel just refused.
class ChunkPlanner {
  public:
    explicit ChunkPlanner(util::ChunkingSettings settings = {});

    std::size_t current_chunk_size() const { return current_; }
    std::size_t max_chunk_size() const { return settings_.max_chunk_size; }
    std::size_t min_chunk_size() const { return settings_.min_chunk_size; }

    // Computes a recommendation and adopts it if the change is larger than
    // the minimum ratio and confidence is high enough.
    ChunkRecommendation update_chunk_size(const NetworkMetrics& metrics);
    ChunkRecommendation recommend(const NetworkMetrics& metrics) const;

    // Lowers the ceiling to what the channel can carry.
    void update_max_chunk_size(std::size_t limit);

    // Shrinks the working size and ceiling after an oversize rejection.
    // Returns false when already at the minimum.
    bool reduce_for_oversize();

    void set_chunk_size(std::size_t size);
    // Feeds the trend analysis with the outcome of one sent chunk.
    void record_performance(double rtt_ms, bool success);
    void reset();
    PlannerStats stats() const;

  private:
    struct Sample {
        std::chrono::steady_clock::time_point at;
        double rtt_ms;
        bool success;
    };

    std::size_t clamp(std::size_t size) const;

    util::ChunkingSettings settings_;
    std::size_t configured_min_;
    std::size_t configured_max_;
    std::size_t current_;
    std::size_t adaptation_count_ = 0;
    std::size_t oversize_reductions_ = 0;
    Trend trend_ = Trend::Stable;
    std::size_t stability_counter_ = 0;
    std::deque<Sample> history_;
};

} // namespace sender
