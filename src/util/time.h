#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Wall-clock milliseconds since the epoch; persisted timestamps use this.
inline std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since,
                               std::chrono::steady_clock::time_point now
                               = std::chrono::steady_clock::now()) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
}

} // namespace util
