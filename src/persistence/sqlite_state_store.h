#pragma once

#include "persistence/state_store.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

struct sqlite3;

namespace persistence {

// Transactional store. Every write runs in its own IMMEDIATE transaction.
// When the expected table is missing, it is dropped and recreated at most
// once per cooldown window; the operation that noticed fails so the caller
// can use its fallback.
class SqliteStateStore : public StateStore {
  public:
    SqliteStateStore(std::filesystem::path db_path, std::chrono::milliseconds recreation_cooldown);
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    bool open();
    bool is_open() const { return db_ != nullptr; }

    const char* name() const override { return "sqlite"; }
    bool put(const std::string& key, const TransferState& state) override;
    std::optional<TransferState> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    std::vector<TransferState> load_all() override;

    int schema_recreations() const { return recreations_; }

  private:
    struct DbCloser {
        void operator()(sqlite3* db) const noexcept;
    };

    bool ensure_schema();
    bool schema_matches();
    bool exec(const char* sql);

    std::filesystem::path db_path_;
    std::chrono::milliseconds recreation_cooldown_;
    std::unique_ptr<sqlite3, DbCloser> db_;
    std::optional<std::chrono::steady_clock::time_point> last_recreation_;
    int recreations_ = 0;
    std::mutex mutex_;
};

} // namespace persistence
