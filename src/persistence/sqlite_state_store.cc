#include "persistence/sqlite_state_store.h"
#include <set>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace persistence {

namespace {
constexpr const char* kCreateSchema = "CREATE TABLE IF NOT EXISTS transfer_states ("
                                      "  state_key TEXT PRIMARY KEY,"
                                      "  role TEXT NOT NULL,"
                                      "  transfer_id TEXT NOT NULL,"
                                      "  payload TEXT NOT NULL,"
                                      "  last_update_ms INTEGER NOT NULL,"
                                      "  resume_attempts INTEGER NOT NULL"
                                      ");";

const std::set<std::string> kExpectedColumns = {
    "state_key", "role", "transfer_id", "payload", "last_update_ms", "resume_attempts"};

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

StmtPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("[SqliteStateStore] prepare failed: {}", sqlite3_errmsg(db));
        return nullptr;
    }
    return StmtPtr(raw);
}

std::optional<TransferState> parse_payload(const unsigned char* text) {
    if (text == nullptr) {
        return std::nullopt;
    }
    const auto j = nlohmann::json::parse(reinterpret_cast<const char*>(text), nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("[SqliteStateStore] Unparseable payload skipped");
        return std::nullopt;
    }
    return state_from_json(j);
}
} // namespace

void SqliteStateStore::DbCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close(db);
}

SqliteStateStore::SqliteStateStore(std::filesystem::path db_path,
                                   std::chrono::milliseconds recreation_cooldown)
    : db_path_(std::move(db_path))
    , recreation_cooldown_(recreation_cooldown) {}

SqliteStateStore::~SqliteStateStore() = default;

bool SqliteStateStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    std::error_code ec;
    const auto parent = db_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("[SqliteStateStore::open] Failed to create {}: {}",
                          parent.string(),
                          ec.message());
            return false;
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(db_path_.string().c_str(),
                                   &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    std::unique_ptr<sqlite3, DbCloser> db(raw);
    if (rc != SQLITE_OK) {
        spdlog::error("[SqliteStateStore::open] Cannot open {}: {}",
                      db_path_.string(),
                      raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        return false;
    }
    sqlite3_busy_timeout(db.get(), 1000);
    db_ = std::move(db);

    if (!exec(kCreateSchema)) {
        db_.reset();
        return false;
    }
    spdlog::info("[SqliteStateStore::open] Opened {}", db_path_.string());
    return true;
}

bool SqliteStateStore::exec(const char* sql) {
    char* message = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &message) != SQLITE_OK) {
        spdlog::error("[SqliteStateStore::exec] {}", message ? message : "unknown error");
        sqlite3_free(message);
        return false;
    }
    return true;
}

bool SqliteStateStore::schema_matches() {
    auto stmt = prepare(db_.get(), "PRAGMA table_info(transfer_states);");
    if (!stmt) {
        return false;
    }
    std::set<std::string> columns;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto* name = sqlite3_column_text(stmt.get(), 1);
        if (name != nullptr) {
            columns.emplace(reinterpret_cast<const char*>(name));
        }
    }
    return columns == kExpectedColumns;
}

bool SqliteStateStore::ensure_schema() {
    if (!db_) {
        return false;
    }
    if (schema_matches()) {
        return true;
    }

    const auto now = std::chrono::steady_clock::now();
    if (last_recreation_ && now - *last_recreation_ < recreation_cooldown_) {
        spdlog::warn("[SqliteStateStore::ensure_schema] Schema missing, recreation on cooldown");
        return false;
    }

    last_recreation_ = now;
    ++recreations_;
    spdlog::warn("[SqliteStateStore::ensure_schema] Schema missing, recreating ({} so far)",
                 recreations_);
    if (exec("DROP TABLE IF EXISTS transfer_states;") && exec(kCreateSchema)) {
        spdlog::info("[SqliteStateStore::ensure_schema] Schema recreated");
    }
    return false;
}

bool SqliteStateStore::put(const std::string& key, const TransferState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_schema()) {
        return false;
    }

    const auto payload = to_json(state).dump();
    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }

    auto stmt = prepare(db_.get(),
                        "INSERT OR REPLACE INTO transfer_states "
                        "(state_key, role, transfer_id, payload, last_update_ms, resume_attempts) "
                        "VALUES (?1, ?2, ?3, ?4, ?5, ?6);");
    bool ok = stmt != nullptr;
    if (ok) {
        sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, error::to_string(state.role), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 3, state.transfer_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 5, state.last_update_time_ms);
        sqlite3_bind_int(stmt.get(), 6, state.resume_attempts);
        ok = sqlite3_step(stmt.get()) == SQLITE_DONE;
        if (!ok) {
            spdlog::error("[SqliteStateStore::put] {} failed: {}", key, sqlite3_errmsg(db_.get()));
        }
    }
    stmt.reset();

    if (!ok) {
        if (!exec("ROLLBACK;")) {
            spdlog::error("[SqliteStateStore::put] Rollback of {} failed", key);
        }
        return false;
    }
    if (!exec("COMMIT;")) {
        // A busy COMMIT leaves the transaction open.
        if (sqlite3_get_autocommit(db_.get()) == 0 && !exec("ROLLBACK;")) {
            spdlog::error("[SqliteStateStore::put] Rollback of {} failed", key);
        }
        return false;
    }
    return true;
}

std::optional<TransferState> SqliteStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_schema()) {
        return std::nullopt;
    }
    auto stmt = prepare(db_.get(), "SELECT payload FROM transfer_states WHERE state_key = ?1;");
    if (!stmt) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return parse_payload(sqlite3_column_text(stmt.get(), 0));
}

bool SqliteStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_schema()) {
        return false;
    }
    auto stmt = prepare(db_.get(), "DELETE FROM transfer_states WHERE state_key = ?1;");
    if (!stmt) {
        return false;
    }
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("[SqliteStateStore::remove] {} failed: {}", key, sqlite3_errmsg(db_.get()));
        return false;
    }
    return true;
}

std::vector<TransferState> SqliteStateStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferState> states;
    if (!ensure_schema()) {
        return states;
    }
    auto stmt = prepare(db_.get(), "SELECT payload FROM transfer_states;");
    if (!stmt) {
        return states;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        if (auto state = parse_payload(sqlite3_column_text(stmt.get(), 0))) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

} // namespace persistence
