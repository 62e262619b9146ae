#pragma once

#include "util/settings.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace progress {

struct AckTransferInfo {
    std::uint64_t file_size = 0;
    std::uint64_t bytes_received = 0;
    std::chrono::steady_clock::time_point start_time;
    std::optional<int> last_acked_percentage;
    std::optional<std::chrono::steady_clock::time_point> last_ack_time;
};

struct AckDecision {
    bool send = false;
    int percentage = 0;
    std::string reason;
};

int progress_percentage(std::uint64_t bytes, std::uint64_t total);

// Decides when the receiver reports progress back to the sender. The cadence
// is tiered by file size and throttled by a global minimum interval.
class AckCoordinator {
  public:
    explicit AckCoordinator(util::AckSettings settings = {})
        : settings_(settings) {}

    AckDecision decide(const AckTransferInfo& info,
                       std::chrono::steady_clock::time_point now
                       = std::chrono::steady_clock::now()) const;

    const util::AckSettings& settings() const { return settings_; }

  private:
    util::AckSettings settings_;
};

} // namespace progress
