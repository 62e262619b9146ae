#include "persistence/persistence_manager.h"
#include "core/timer/spawn_after_delay.h"
#include "persistence/json_state_store.h"
#include "persistence/sqlite_state_store.h"
#include "util/time.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace persistence {

PersistenceManager::PersistenceManager(core::Executor& executor,
                                       error::Role role,
                                       util::PersistenceSettings settings,
                                       std::unique_ptr<StateStore> primary,
                                       std::unique_ptr<StateStore> fallback)
    : executor_(executor)
    , role_(role)
    , settings_(std::move(settings))
    , primary_(std::move(primary))
    , fallback_(std::move(fallback)) {}

std::unique_ptr<PersistenceManager> PersistenceManager::create(
    core::Executor& executor,
    error::Role role,
    const util::PersistenceSettings& settings) {
    const std::filesystem::path dir(settings.directory);

    std::unique_ptr<StateStore> primary;
    if (settings.prefer_transactional) {
        auto sqlite = std::make_unique<SqliteStateStore>(
            dir / settings.database, std::chrono::milliseconds(settings.recreation_cooldown_ms));
        if (sqlite->open()) {
            primary = std::move(sqlite);
        } else {
            spdlog::warn("[PersistenceManager::create] Transactional store unavailable, "
                         "using JSON records only");
        }
    }
    auto fallback = std::make_unique<JsonStateStore>(dir / "records", settings.max_state_size);
    return std::make_unique<PersistenceManager>(
        executor, role, settings, std::move(primary), std::move(fallback));
}

TransferState PersistenceManager::create_transfer_state(const NewTransfer& transfer) {
    TransferState state;
    state.transfer_id = transfer.transfer_id;
    state.file_name = transfer.file_name;
    state.file_size = transfer.file_size;
    state.file_hash = transfer.file_hash;
    state.total_chunks = transfer.total_chunks;
    state.chunk_size = transfer.chunk_size;
    state.storage_method = transfer.storage_method;
    state.destination_path = transfer.destination_path;
    state.role = role_;
    state.start_time_ms = util::now_ms();
    state.last_update_time_ms = state.start_time_ms;

    save_transfer_state(state);
    return state;
}

void PersistenceManager::save_transfer_state(const TransferState& state) {
    if (!settings_.enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(state.transfer_id);
    cache_[key] = state;
    schedule_flush_locked(key);
}

void PersistenceManager::schedule_flush_locked(const std::string& key) {
    if (!scheduled_.insert(key).second) {
        return;
    }
    executor_.spawn(delayed_flush(key));
}

asio::awaitable<void> PersistenceManager::delayed_flush(std::string key) {
    co_await core::timer::sleep_for(std::chrono::milliseconds(settings_.save_throttle_ms));

    std::lock_guard<std::mutex> lock(mutex_);
    if (scheduled_.erase(key) == 0) {
        co_return;
    }
    const auto it = cache_.find(key);
    if (it != cache_.end() && !write_through_locked(it->second)) {
        spdlog::error("[PersistenceManager::delayed_flush] Could not persist {}", key);
    }
}

bool PersistenceManager::flush(const std::string& transfer_id) {
    if (!settings_.enabled) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(transfer_id);
    scheduled_.erase(key);
    const auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    return write_through_locked(it->second);
}

void PersistenceManager::flush_all() {
    if (!settings_.enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : scheduled_) {
        const auto it = cache_.find(key);
        if (it != cache_.end() && !write_through_locked(it->second)) {
            spdlog::error("[PersistenceManager::flush_all] Could not persist {}", key);
        }
    }
    scheduled_.clear();
}

bool PersistenceManager::primary_usable_locked() const {
    if (!primary_) {
        return false;
    }
    return !primary_disabled_until_ || std::chrono::steady_clock::now() >= *primary_disabled_until_;
}

bool PersistenceManager::write_through_locked(const TransferState& state) {
    const auto key = key_for(state.transfer_id);

    if (primary_usable_locked()) {
        apply_pending_removals_locked();
        if (primary_->put(key, state)) {
            consecutive_failures_ = 0;
            primary_disabled_until_.reset();
            pending_removals_.erase(key);
            return true;
        }
        ++consecutive_failures_;
        spdlog::warn("[PersistenceManager::write_through] {} write failed ({}/{})",
                     primary_->name(),
                     consecutive_failures_,
                     settings_.max_primary_failures);
        if (consecutive_failures_ >= settings_.max_primary_failures) {
            primary_disabled_until_ = std::chrono::steady_clock::now()
                                      + std::chrono::milliseconds(settings_.primary_cooldown_ms);
            consecutive_failures_ = 0;
            spdlog::warn("[PersistenceManager::write_through] Bypassing {} for {} ms",
                         primary_->name(),
                         settings_.primary_cooldown_ms);
        }
    }

    if (fallback_ && fallback_->put(key, state)) {
        return true;
    }
    spdlog::error("[PersistenceManager::write_through] No store accepted {}", key);
    return false;
}

std::optional<TransferState> PersistenceManager::load_locked(const std::string& key) {
    const auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        return cached->second;
    }
    if (!settings_.enabled) {
        return std::nullopt;
    }

    std::optional<TransferState> state;
    if (primary_usable_locked()) {
        apply_pending_removals_locked();
        if (!pending_removals_.contains(key)) {
            state = primary_->get(key);
        }
    }
    if (!state && fallback_) {
        state = fallback_->get(key);
    }
    if (state) {
        cache_[key] = *state;
    }
    return state;
}

std::optional<TransferState> PersistenceManager::load_transfer_state(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(key_for(transfer_id));
}

bool PersistenceManager::mark_chunk_received(const std::string& transfer_id,
                                             std::uint64_t chunk_index,
                                             std::uint64_t chunk_size,
                                             bool verified,
                                             const std::string& chunk_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(transfer_id);
    auto state = load_locked(key);
    if (!state) {
        spdlog::debug("[PersistenceManager::mark_chunk_received] No state for {}", transfer_id);
        return false;
    }

    const bool added = state->received_chunks.insert(chunk_index).second;
    if (!added) {
        return false;
    }
    state->bytes_received += chunk_size;
    if (chunk_index >= state->total_chunks) {
        state->total_chunks = chunk_index + 1;
    }
    if (verified) {
        state->verified_chunks.insert(chunk_index);
    }
    if (!chunk_hash.empty()) {
        state->chunk_hashes[chunk_index] = chunk_hash;
    }
    state->last_update_time_ms = util::now_ms();

    cache_[key] = *state;
    if (settings_.enabled) {
        schedule_flush_locked(key);
    }
    return true;
}

bool PersistenceManager::update_total_chunks(const std::string& transfer_id,
                                             std::uint64_t total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(transfer_id);
    auto state = load_locked(key);
    if (!state) {
        return false;
    }
    state->total_chunks = total_chunks;
    std::erase_if(state->received_chunks, [total_chunks](auto i) { return i >= total_chunks; });
    std::erase_if(state->verified_chunks, [total_chunks](auto i) { return i >= total_chunks; });
    state->last_update_time_ms = util::now_ms();
    cache_[key] = *state;
    if (settings_.enabled) {
        schedule_flush_locked(key);
    }
    return true;
}

bool PersistenceManager::record_resume_attempt(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(transfer_id);
    auto state = load_locked(key);
    if (!state) {
        return false;
    }
    ++state->resume_attempts;
    state->last_resume_time_ms = util::now_ms();
    state->last_update_time_ms = state->last_resume_time_ms;
    cache_[key] = *state;
    scheduled_.erase(key);
    return !settings_.enabled || write_through_locked(*state);
}

bool PersistenceManager::can_resume_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto state = load_locked(key_for(transfer_id));
    if (!state) {
        return false;
    }
    if (util::now_ms() - state->start_time_ms > settings_.max_state_age_ms) {
        spdlog::debug("[PersistenceManager::can_resume_transfer] {} is too old", transfer_id);
        return false;
    }
    if (state->resume_attempts >= settings_.max_resume_attempts) {
        spdlog::debug("[PersistenceManager::can_resume_transfer] {} used {} resume attempts",
                      transfer_id,
                      state->resume_attempts);
        return false;
    }
    const auto fraction = state->received_fraction();
    return fraction > 0.0 && fraction < 1.0;
}

std::vector<std::uint64_t> PersistenceManager::get_missing_chunks(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto state = load_locked(key_for(transfer_id));
    if (!state) {
        return {};
    }
    return state->missing_chunks();
}

bool PersistenceManager::remove_transfer_state(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = key_for(transfer_id);
    cache_.erase(key);
    scheduled_.erase(key);
    if (!settings_.enabled) {
        return true;
    }

    // The primary is asked even during its cooldown; a refused delete is
    // retried before the primary is read or written again.
    bool ok = true;
    if (primary_ && !primary_->remove(key)) {
        pending_removals_.insert(key);
        spdlog::warn("[PersistenceManager::remove_transfer_state] {} kept {}, removal deferred",
                     primary_->name(),
                     key);
        ok = false;
    } else {
        pending_removals_.erase(key);
    }
    if (fallback_ && !fallback_->remove(key)) {
        ok = false;
    }
    return ok;
}

void PersistenceManager::apply_pending_removals_locked() {
    for (auto it = pending_removals_.begin(); it != pending_removals_.end();) {
        if (!primary_->remove(*it)) {
            return;
        }
        spdlog::debug("[PersistenceManager::apply_pending_removals] Removed {} from {}",
                      *it,
                      primary_->name());
        it = pending_removals_.erase(it);
    }
}

std::size_t PersistenceManager::cleanup_old_states() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, TransferState> known;
    if (settings_.enabled) {
        if (primary_usable_locked()) {
            apply_pending_removals_locked();
            for (auto& s : primary_->load_all()) {
                auto key = key_for(s.transfer_id);
                if (!pending_removals_.contains(key)) {
                    known[std::move(key)] = std::move(s);
                }
            }
        }
        if (fallback_) {
            for (auto& s : fallback_->load_all()) {
                known.try_emplace(key_for(s.transfer_id), std::move(s));
            }
        }
    }
    for (const auto& [key, s] : cache_) {
        known[key] = s;
    }

    const auto cutoff = util::now_ms() - settings_.max_state_age_ms;
    std::vector<std::string> doomed;
    std::vector<std::pair<std::int64_t, std::string>> survivors;
    for (const auto& [key, s] : known) {
        if (s.role != role_) {
            continue;
        }
        if (s.last_update_time_ms < cutoff || s.resume_attempts >= settings_.max_resume_attempts) {
            doomed.push_back(key);
        } else {
            survivors.emplace_back(s.last_update_time_ms, key);
        }
    }

    if (survivors.size() > settings_.max_stored_transfers) {
        std::sort(survivors.begin(), survivors.end());
        const auto excess = survivors.size() - settings_.max_stored_transfers;
        for (std::size_t i = 0; i < excess; ++i) {
            doomed.push_back(survivors[i].second);
        }
    }

    for (const auto& key : doomed) {
        cache_.erase(key);
        scheduled_.erase(key);
        if (!settings_.enabled) {
            continue;
        }
        if (primary_ && !primary_->remove(key)) {
            pending_removals_.insert(key);
            spdlog::warn("[PersistenceManager::cleanup_old_states] {} kept a copy of {}",
                         primary_->name(),
                         key);
        }
        if (fallback_ && !fallback_->remove(key)) {
            spdlog::warn("[PersistenceManager::cleanup_old_states] {} kept a copy of {}",
                         fallback_->name(),
                         key);
        }
    }

    if (!doomed.empty()) {
        spdlog::info("[PersistenceManager::cleanup_old_states] Removed {} stale records",
                     doomed.size());
    }
    return doomed.size();
}

asio::awaitable<void> PersistenceManager::run_periodic_cleanup() {
    const auto interval = std::chrono::milliseconds(settings_.cleanup_interval_ms);
    while (!stopped_) {
        if (!co_await core::timer::sleep_for(interval) || stopped_) {
            co_return;
        }
        cleanup_old_states();
    }
}

bool PersistenceManager::primary_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return primary_usable_locked();
}

int PersistenceManager::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

} // namespace persistence
