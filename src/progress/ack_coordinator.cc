#include "progress/ack_coordinator.h"
#include <cmath>

namespace progress {

int progress_percentage(std::uint64_t bytes, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    const auto ratio = static_cast<double>(bytes) / static_cast<double>(total);
    return static_cast<int>(std::lround(ratio * 100.0));
}

AckDecision AckCoordinator::decide(const AckTransferInfo& info,
                                   std::chrono::steady_clock::time_point now) const {
    AckDecision decision;
    decision.percentage = progress_percentage(info.bytes_received, info.file_size);
    const int pct = decision.percentage;
    const int last = info.last_acked_percentage.value_or(0);

    if (pct >= 100 && last < 100) {
        decision.send = true;
        decision.reason = "completion";
        return decision;
    }

    const auto min_interval = std::chrono::milliseconds(settings_.min_interval_ms);
    if (info.last_ack_time && now - *info.last_ack_time < min_interval) {
        decision.reason = "throttled";
        return decision;
    }

    if (info.file_size < settings_.small_file_threshold) {
        decision.send = pct > last;
        decision.reason = decision.send ? "percent step" : "no progress";
        return decision;
    }

    // Step boundaries rather than exact multiples, so a jump over a
    // multiple still counts.
    const auto crossed = [pct, last](int step) {
        return pct > last && pct / step > last / step;
    };

    if (info.file_size < settings_.medium_file_threshold) {
        decision.send = crossed(2);
        decision.reason = decision.send ? "2% step" : "below step";
        return decision;
    }

    const auto since = now - info.last_ack_time.value_or(info.start_time);
    if (since >= std::chrono::milliseconds(settings_.large_file_interval_ms)) {
        decision.send = true;
        decision.reason = "interval";
        return decision;
    }
    decision.send = crossed(5);
    decision.reason = decision.send ? "5% step" : "below step";
    return decision;
}

} // namespace progress
