#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace error {

// Counts retries per (transfer, chunk).
class RetryTracker {
  public:
    explicit RetryTracker(int max_retries = 3)
        : max_retries_(max_retries) {}

    // Records one more attempt and returns the new count.
    int add(const std::string& transfer_id, std::uint64_t chunk_index);
    bool should_retry(const std::string& transfer_id, std::uint64_t chunk_index) const;
    int retry_count(const std::string& transfer_id, std::uint64_t chunk_index) const;
    void remove(const std::string& transfer_id, std::uint64_t chunk_index);
    std::vector<std::uint64_t> pending(const std::string& transfer_id) const;
    void clear(const std::string& transfer_id);
    void clear_all() { counts_.clear(); }

    int max_retries() const { return max_retries_; }

  private:
    int max_retries_;
    std::map<std::pair<std::string, std::uint64_t>, int> counts_;
};

} // namespace error
