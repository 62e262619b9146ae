#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace progress {

// Stall window for a transfer: the base timeout until a rate is known, then
// three times the estimated remaining time, capped at five times the base.
inline std::chrono::milliseconds adaptive_timeout(std::uint64_t file_size,
                                                  std::uint64_t bytes_transferred,
                                                  std::chrono::milliseconds elapsed,
                                                  std::chrono::milliseconds base) {
    if (bytes_transferred == 0 || elapsed.count() <= 0 || bytes_transferred >= file_size) {
        return base;
    }
    const double rate = static_cast<double>(bytes_transferred) / static_cast<double>(elapsed.count());
    const auto remaining_ms = static_cast<std::int64_t>(
        static_cast<double>(file_size - bytes_transferred) / rate);
    const auto scaled = std::chrono::milliseconds(remaining_ms * 3);
    return std::min(std::max(base, scaled), base * 5);
}

} // namespace progress
