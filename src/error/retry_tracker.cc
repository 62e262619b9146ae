#include "error/retry_tracker.h"
#include <spdlog/spdlog.h>

namespace error {

int RetryTracker::add(const std::string& transfer_id, std::uint64_t chunk_index) {
    const int count = ++counts_[{transfer_id, chunk_index}];
    spdlog::debug("[RetryTracker::add] {} chunk {} attempt {}/{}",
                  transfer_id,
                  chunk_index,
                  count,
                  max_retries_);
    return count;
}

bool RetryTracker::should_retry(const std::string& transfer_id, std::uint64_t chunk_index) const {
    return retry_count(transfer_id, chunk_index) < max_retries_;
}

int RetryTracker::retry_count(const std::string& transfer_id, std::uint64_t chunk_index) const {
    const auto it = counts_.find({transfer_id, chunk_index});
    return it == counts_.end() ? 0 : it->second;
}

void RetryTracker::remove(const std::string& transfer_id, std::uint64_t chunk_index) {
    counts_.erase({transfer_id, chunk_index});
}

std::vector<std::uint64_t> RetryTracker::pending(const std::string& transfer_id) const {
    std::vector<std::uint64_t> chunks;
    for (auto it = counts_.lower_bound({transfer_id, 0});
         it != counts_.end() && it->first.first == transfer_id;
         ++it) {
        chunks.push_back(it->first.second);
    }
    return chunks;
}

void RetryTracker::clear(const std::string& transfer_id) {
    auto it = counts_.lower_bound({transfer_id, 0});
    while (it != counts_.end() && it->first.first == transfer_id) {
        it = counts_.erase(it);
    }
}

} // namespace error
