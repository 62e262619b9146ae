#pragma once

#include "core/executor.h"
#include "persistence/state_store.h"
#include "persistence/transfer_state.h"
#include "util/settings.h"
#include <asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace persistence {

struct NewTransfer {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string file_hash;
    std::uint64_t total_chunks = 0;
    std::uint64_t chunk_size = 64 * 1024;
    StorageMethod storage_method = StorageMethod::Memory;
    std::string destination_path;
};

// Resumable transfer state for one role. Saves land in the cache at once and
// reach durable storage through a per-record throttle window; flush() writes
// through immediately. The transactional store is preferred; after repeated
// write failures it is bypassed for a cooldown and the fallback store is used.
class PersistenceManager {
  public:
    PersistenceManager(core::Executor& executor,
                       error::Role role,
                       util::PersistenceSettings settings,
                       std::unique_ptr<StateStore> primary,
                       std::unique_ptr<StateStore> fallback);

    // Builds the SQLite and JSON stores under settings.directory.
    static std::unique_ptr<PersistenceManager> create(core::Executor& executor,
                                                      error::Role role,
                                                      const util::PersistenceSettings& settings);

    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    TransferState create_transfer_state(const NewTransfer& transfer);
    void save_transfer_state(const TransferState& state);
    bool flush(const std::string& transfer_id);
    void flush_all();

    std::optional<TransferState> load_transfer_state(const std::string& transfer_id);

    // Returns true if the chunk was not recorded before.
    bool mark_chunk_received(const std::string& transfer_id,
                             std::uint64_t chunk_index,
                             std::uint64_t chunk_size,
                             bool verified,
                             const std::string& chunk_hash = {});
    bool update_total_chunks(const std::string& transfer_id, std::uint64_t total_chunks);
    bool record_resume_attempt(const std::string& transfer_id);

    bool can_resume_transfer(const std::string& transfer_id);
    std::vector<std::uint64_t> get_missing_chunks(const std::string& transfer_id);

    // Purges expired or exhausted records; returns how many were removed.
    std::size_t cleanup_old_states();
    // Returns false if a store kept its copy. A copy left in the primary is
    // never loaded and is deleted on the next primary access.
    bool remove_transfer_state(const std::string& transfer_id);

    asio::awaitable<void> run_periodic_cleanup();
    void stop() { stopped_ = true; }

    bool primary_available() const;
    int consecutive_failures() const;
    error::Role role() const { return role_; }
    const util::PersistenceSettings& settings() const { return settings_; }

  private:
    std::string key_for(const std::string& transfer_id) const { return state_key(role_, transfer_id); }
    std::optional<TransferState> load_locked(const std::string& key);
    bool write_through_locked(const TransferState& state);
    bool primary_usable_locked() const;
    void apply_pending_removals_locked();
    void schedule_flush_locked(const std::string& key);
    asio::awaitable<void> delayed_flush(std::string key);

    core::Executor& executor_;
    error::Role role_;
    util::PersistenceSettings settings_;
    std::unique_ptr<StateStore> primary_;
    std::unique_ptr<StateStore> fallback_;

    std::map<std::string, TransferState> cache_;
    std::set<std::string> scheduled_;
    // Keys the primary refused to delete.
    std::set<std::string> pending_removals_;
    int consecutive_failures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> primary_disabled_until_;
    bool stopped_ = false;
    mutable std::mutex mutex_;
};

} // namespace persistence
