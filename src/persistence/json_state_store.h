#pragma once

#include "persistence/state_store.h"
#include <filesystem>
#include <mutex>

namespace persistence {

// Fallback store: one JSON document per key under a directory, replaced
// atomically through a temp file and rename.
class JsonStateStore : public StateStore {
  public:
    JsonStateStore(std::filesystem::path directory, std::size_t max_record_size);

    const char* name() const override { return "json"; }
    bool put(const std::string& key, const TransferState& state) override;
    std::optional<TransferState> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    std::vector<TransferState> load_all() override;

  private:
    std::filesystem::path path_for(const std::string& key) const;
    std::optional<TransferState> read_file(const std::filesystem::path& path) const;

    std::filesystem::path directory_;
    std::size_t max_record_size_;
    std::mutex mutex_;
};

} // namespace persistence
