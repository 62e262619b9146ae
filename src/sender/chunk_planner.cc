#include "sender/chunk_planner.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace sender {

namespace {
constexpr double kMinRttForFactors = 50.0;
constexpr double kSaturationRatio = 0.95;
constexpr auto kHistoryWindow = std::chrono::minutes(2);
} // namespace

ChunkPlanner::ChunkPlanner(util::ChunkingSettings settings)
    : settings_(settings)
    , configured_min_(settings.min_chunk_size)
    , configured_max_(settings.max_chunk_size)
    , current_(0) {
    settings_.min_chunk_size = std::max<std::size_t>(settings_.min_chunk_size, 1);
    settings_.max_chunk_size = std::max(settings_.max_chunk_size, settings_.min_chunk_size);
    configured_min_ = settings_.min_chunk_size;
    configured_max_ = settings_.max_chunk_size;
    current_ = clamp(settings_.default_chunk_size);
}

std::size_t ChunkPlanner::clamp(std::size_t size) const {
    return std::clamp(size, settings_.min_chunk_size, settings_.max_chunk_size);
}

ChunkRecommendation ChunkPlanner::recommend(const NetworkMetrics& metrics) const {
    ChunkRecommendation rec;
    rec.quality = metrics.quality;
    double factor = 1.0;

    switch (metrics.quality) {
    case NetworkQuality::Excellent:
        factor = 1.5;
        rec.confidence = 0.9;
        rec.reasoning = "excellent network";
        break;
    case NetworkQuality::Good:
        factor = 1.2;
        rec.confidence = 0.8;
        rec.reasoning = "good network";
        break;
    case NetworkQuality::Fair:
        if (metrics.average_rtt_ms > settings_.target_rtt_ms) {
            factor = 0.9;
            rec.reasoning = "fair network, high RTT";
        } else {
            factor = 1.1;
            rec.reasoning = "fair network";
        }
        rec.confidence = 0.6;
        break;
    case NetworkQuality::Poor:
        factor = 0.7;
        rec.confidence = 0.9;
        rec.reasoning = "poor network";
        break;
    }

    if (metrics.average_rtt_ms > 0.0) {
        const double rtt_factor = settings_.target_rtt_ms
                                  / std::max(metrics.average_rtt_ms, kMinRttForFactors);
        factor *= std::pow(rtt_factor, 0.3);
    }

    if (metrics.estimated_bandwidth > 0.0) {
        const double throughput = static_cast<double>(current_) * 1000.0
                                  / std::max(metrics.average_rtt_ms, kMinRttForFactors);
        const double utilization = throughput / metrics.estimated_bandwidth;
        if (utilization < settings_.bandwidth_utilization_target) {
            factor *= std::min(1.0 + (settings_.bandwidth_utilization_target - utilization), 1.5);
            rec.reasoning += ", bandwidth underused";
        } else if (utilization > kSaturationRatio) {
            factor *= 0.9;
            rec.reasoning += ", bandwidth saturated";
        }
    }

    if (metrics.average_buffer_level > 0.0 && settings_.buffer_capacity > 0) {
        const double buffer_utilization = metrics.average_buffer_level
                                          / static_cast<double>(settings_.buffer_capacity);
        if (buffer_utilization > settings_.target_buffer_utilization) {
            factor *= 0.8;
            rec.confidence *= 0.9;
            rec.reasoning += ", buffer under pressure";
        }
    }

    if (metrics.jitter_ms > settings_.stability_threshold_ms) {
        factor *= 0.9;
        rec.confidence *= 0.8;
        rec.reasoning += ", unstable RTT";
    } else {
        rec.confidence *= 1.1;
    }

    const double current = static_cast<double>(current_);
    const double target = current * factor;
    const double next = current + (target - current) * settings_.adaptation_rate;
    rec.chunk_size = clamp(static_cast<std::size_t>(std::llround(std::max(next, 1.0))));
    rec.confidence = std::clamp(rec.confidence, 0.1, 1.0);
    rec.adaptation_factor = factor;
    return rec;
}

ChunkRecommendation ChunkPlanner::update_chunk_size(const NetworkMetrics& metrics) {
    auto rec = recommend(metrics);
    if (!settings_.adaptive) {
        rec.chunk_size = current_;
        rec.reasoning = "adaptive chunking disabled";
        return rec;
    }

    const double change = std::abs(static_cast<double>(rec.chunk_size) - static_cast<double>(current_))
                          / static_cast<double>(current_);
    if (change > settings_.min_change_ratio && rec.confidence > settings_.min_confidence) {
        spdlog::debug("[ChunkPlanner::update_chunk_size] {} -> {} bytes ({}, confidence {:.2f})",
                      current_,
                      rec.chunk_size,
                      rec.reasoning,
                      rec.confidence);
        current_ = rec.chunk_size;
        ++adaptation_count_;
    }
    return rec;
}

void ChunkPlanner::update_max_chunk_size(std::size_t limit) {
    if (limit == 0) {
        return;
    }
    settings_.max_chunk_size = std::min(settings_.max_chunk_size, limit);
    if (settings_.min_chunk_size > settings_.max_chunk_size) {
        settings_.min_chunk_size = settings_.max_chunk_size;
    }
    current_ = clamp(current_);
}

bool ChunkPlanner::reduce_for_oversize() {
    const auto reduced = static_cast<std::size_t>(
        std::floor(static_cast<double>(current_) * settings_.oversize_reduction));
    if (current_ <= settings_.min_chunk_size || reduced < 1) {
        spdlog::warn("[ChunkPlanner::reduce_for_oversize] Already at minimum chunk size {}",
                     current_);
        return false;
    }
    const auto previous = current_;
    update_max_chunk_size(std::max(reduced, settings_.min_chunk_size));
    current_ = clamp(reduced);
    ++oversize_reductions_;
    spdlog::info("[ChunkPlanner::reduce_for_oversize] Chunk size {} -> {} after oversize rejection",
                 previous,
                 current_);
    return true;
}

void ChunkPlanner::set_chunk_size(std::size_t size) {
    current_ = clamp(size);
}

void ChunkPlanner::record_performance(double rtt_ms, bool success) {
    const auto now = std::chrono::steady_clock::now();
    history_.push_back({now, rtt_ms, success});
    while (!history_.empty() && now - history_.front().at > kHistoryWindow) {
        history_.pop_front();
    }
    if (history_.size() < settings_.quality_window) {
        return;
    }

    double rtt_sum = 0.0;
    std::size_t successes = 0;
    const auto begin = history_.end() - static_cast<std::ptrdiff_t>(settings_.quality_window);
    for (auto it = begin; it != history_.end(); ++it) {
        rtt_sum += it->rtt_ms;
        successes += it->success ? 1 : 0;
    }
    const double window = static_cast<double>(settings_.quality_window);
    const double avg_rtt = rtt_sum / window;
    const double success_rate = static_cast<double>(successes) / window;

    if (avg_rtt < settings_.target_rtt_ms && success_rate > 0.95) {
        trend_ = Trend::Increasing;
        ++stability_counter_;
    } else if (avg_rtt > settings_.target_rtt_ms * 1.5 || success_rate < 0.9) {
        trend_ = Trend::Decreasing;
        stability_counter_ = 0;
    } else {
        trend_ = Trend::Stable;
        ++stability_counter_;
    }
}

void ChunkPlanner::reset() {
    settings_.min_chunk_size = configured_min_;
    settings_.max_chunk_size = configured_max_;
    current_ = clamp(settings_.default_chunk_size);
    adaptation_count_ = 0;
    oversize_reductions_ = 0;
    trend_ = Trend::Stable;
    stability_counter_ = 0;
    history_.clear();
}

PlannerStats ChunkPlanner::stats() const {
    return {current_, settings_.max_chunk_size, adaptation_count_, oversize_reductions_, trend_,
            stability_counter_};
}

} // namespace sender
