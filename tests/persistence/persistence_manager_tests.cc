#include "persistence/persistence_manager.h"
#include "core/executor_fixture.h"
#include "core/temp_dir.h"
#include "util/time.h"
#include <map>
#include <mutex>

using namespace std::chrono_literals;
using persistence::NewTransfer;
using persistence::PersistenceManager;
using persistence::StorageMethod;
using persistence::TransferState;

namespace {
// In-memory store that can be told to fail.
class FakeStore : public persistence::StateStore {
  public:
    explicit FakeStore(const char* name)
        : name_(name) {}

    const char* name() const override { return name_; }

    bool put(const std::string& key, const TransferState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++puts;
        if (failing) {
            return false;
        }
        records[key] = state;
        return true;
    }

    std::optional<TransferState> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records.find(key);
        if (it == records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (refuse_removes) {
            return false;
        }
        records.erase(key);
        return true;
    }

    std::vector<TransferState> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TransferState> all;
        for (const auto& [key, state] : records) {
            all.push_back(state);
        }
        return all;
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records.size();
    }

    std::atomic<bool> failing{false};
    std::atomic<bool> refuse_removes{false};
    std::atomic<int> puts{0};
    std::map<std::string, TransferState> records;

  private:
    const char* name_;
    std::mutex mutex_;
};

NewTransfer new_transfer(const std::string& id, std::uint64_t total_chunks = 10) {
    NewTransfer t;
    t.transfer_id = id;
    t.file_name = id + ".bin";
    t.file_size = total_chunks * 1024;
    t.file_hash = "hash";
    t.total_chunks = total_chunks;
    t.chunk_size = 1024;
    t.storage_method = StorageMethod::Streaming;
    return t;
}
} // namespace

class PersistenceManagerTest : public ExecutorTest {
  protected:
    util::PersistenceSettings settings;
    FakeStore* primary = nullptr;
    FakeStore* fallback = nullptr;
    std::unique_ptr<PersistenceManager> manager;

    void SetUp() override {
        ExecutorTest::SetUp();
        settings.save_throttle_ms = 50;
        settings.max_primary_failures = 2;
        settings.primary_cooldown_ms = 60000;
        make_manager();
    }

    void TearDown() override {
        ExecutorTest::TearDown();
        manager.reset();
    }

    void make_manager() {
        auto p = std::make_unique<FakeStore>("primary");
        auto f = std::make_unique<FakeStore>("fallback");
        primary = p.get();
        fallback = f.get();
        manager = std::make_unique<PersistenceManager>(
            executor, error::Role::Receiver, settings, std::move(p), std::move(f));
    }

    std::string key(const std::string& id) const { return persistence::state_key(error::Role::Receiver, id); }
};

TEST_F(PersistenceManagerTest, SavesAreThrottled) {
    manager->create_transfer_state(new_transfer("t"));
    for (std::uint64_t i = 0; i < 5; ++i) {
        EXPECT_TRUE(manager->mark_chunk_received("t", i, 1024, true));
    }
    // 只在缓存里，尚未写盘
    EXPECT_EQ(primary->puts.load(), 0);
    EXPECT_EQ(manager->load_transfer_state("t")->received_chunks.size(), 5u);

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(primary->puts.load(), 1);
    const auto stored = primary->get(key("t"));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->received_chunks.size(), 5u);
    EXPECT_EQ(stored->bytes_received, 5u * 1024);
}

TEST_F(PersistenceManagerTest, FlushWritesThrough) {
    manager->create_transfer_state(new_transfer("t"));
    EXPECT_TRUE(manager->flush("t"));
    EXPECT_EQ(primary->puts.load(), 1);
    EXPECT_FALSE(manager->flush("unknown"));

    // The pending timer finds nothing left to do.
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(primary->puts.load(), 1);
}

TEST_F(PersistenceManagerTest, DuplicateChunksAreNotCounted) {
    manager->create_transfer_state(new_transfer("t"));
    EXPECT_TRUE(manager->mark_chunk_received("t", 2, 1024, true, "h2"));
    EXPECT_FALSE(manager->mark_chunk_received("t", 2, 1024, true, "h2"));

    const auto state = manager->load_transfer_state("t");
    EXPECT_EQ(state->bytes_received, 1024u);
    EXPECT_EQ(state->chunk_hashes.at(2), "h2");
    EXPECT_TRUE(state->verified_chunks.contains(2));
    EXPECT_FALSE(manager->mark_chunk_received("unknown", 0, 1, false));
}

TEST_F(PersistenceManagerTest, MissingChunksAfterPrefix) {
    manager->create_transfer_state(new_transfer("t", 8));
    for (std::uint64_t i = 0; i <= 4; ++i) {
        manager->mark_chunk_received("t", i, 1024, true);
    }
    EXPECT_EQ(manager->get_missing_chunks("t"), (std::vector<std::uint64_t>{5, 6, 7}));
    EXPECT_TRUE(manager->can_resume_transfer("t"));
    EXPECT_TRUE(manager->get_missing_chunks("unknown").empty());
}

TEST_F(PersistenceManagerTest, ResumeAttemptsAreCapped) {
    settings.max_resume_attempts = 2;
    make_manager();
    manager->create_transfer_state(new_transfer("t"));
    manager->mark_chunk_received("t", 0, 1024, true);

    EXPECT_TRUE(manager->can_resume_transfer("t"));
    EXPECT_TRUE(manager->record_resume_attempt("t"));
    EXPECT_TRUE(manager->can_resume_transfer("t"));
    EXPECT_TRUE(manager->record_resume_attempt("t"));
    EXPECT_FALSE(manager->can_resume_transfer("t"));
    EXPECT_FALSE(manager->get_missing_chunks("t").empty());

    // Attempts are written through.
    EXPECT_EQ(primary->get(key("t"))->resume_attempts, 2);
}

TEST_F(PersistenceManagerTest, NothingOrEverythingReceivedIsNotResumable) {
    manager->create_transfer_state(new_transfer("t", 2));
    EXPECT_FALSE(manager->can_resume_transfer("t"));
    manager->mark_chunk_received("t", 0, 1024, true);
    manager->mark_chunk_received("t", 1, 1024, true);
    EXPECT_FALSE(manager->can_resume_transfer("t"));
}

TEST_F(PersistenceManagerTest, TotalChunksShrinkDropsOutOfRangeChunks) {
    manager->create_transfer_state(new_transfer("t", 10));
    manager->mark_chunk_received("t", 0, 1024, true);
    manager->mark_chunk_received("t", 9, 1024, true);
    ASSERT_TRUE(manager->update_total_chunks("t", 5));

    const auto state = manager->load_transfer_state("t");
    EXPECT_EQ(state->total_chunks, 5u);
    EXPECT_EQ(state->received_chunks, (std::set<std::uint64_t>{0}));
}

TEST_F(PersistenceManagerTest, FallsBackAfterRepeatedPrimaryFailures) {
    primary->failing = true;
    manager->create_transfer_state(new_transfer("a"));
    manager->create_transfer_state(new_transfer("b"));

    EXPECT_TRUE(manager->flush("a"));
    EXPECT_EQ(manager->consecutive_failures(), 1);
    EXPECT_TRUE(manager->primary_available());

    EXPECT_TRUE(manager->flush("b"));
    EXPECT_FALSE(manager->primary_available());
    EXPECT_TRUE(fallback->get(key("a")).has_value());
    EXPECT_TRUE(fallback->get(key("b")).has_value());

    // Bypassed during the cooldown.
    const int puts = primary->puts.load();
    EXPECT_TRUE(manager->flush("a"));
    EXPECT_EQ(primary->puts.load(), puts);
}

TEST_F(PersistenceManagerTest, LoadsFromStoresWhenNotCached) {
    TransferState state;
    state.transfer_id = "old";
    state.file_name = "old.bin";
    state.total_chunks = 3;
    state.received_chunks = {0};
    state.start_time_ms = util::now_ms();
    state.last_update_time_ms = state.start_time_ms;
    fallback->records[key("old")] = state;

    const auto loaded = manager->load_transfer_state("old");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->file_name, "old.bin");
    EXPECT_EQ(manager->get_missing_chunks("old"), (std::vector<std::uint64_t>{1, 2}));
}

TEST_F(PersistenceManagerTest, RemoveClearsEverywhere) {
    manager->create_transfer_state(new_transfer("t"));
    ASSERT_TRUE(manager->flush("t"));
    fallback->records[key("t")] = *manager->load_transfer_state("t");

    EXPECT_TRUE(manager->remove_transfer_state("t"));
    EXPECT_FALSE(manager->load_transfer_state("t").has_value());
    EXPECT_EQ(primary->size(), 0u);
    EXPECT_EQ(fallback->size(), 0u);
}

TEST_F(PersistenceManagerTest, RemoveReachesPrimaryDuringCooldown) {
    manager->create_transfer_state(new_transfer("t"));
    ASSERT_TRUE(manager->flush("t"));
    ASSERT_TRUE(primary->get(key("t")).has_value());

    primary->failing = true;
    manager->create_transfer_state(new_transfer("a"));
    manager->create_transfer_state(new_transfer("b"));
    manager->flush("a");
    manager->flush("b");
    ASSERT_FALSE(manager->primary_available());

    EXPECT_TRUE(manager->remove_transfer_state("t"));
    EXPECT_FALSE(primary->get(key("t")).has_value());
    EXPECT_FALSE(manager->load_transfer_state("t").has_value());
}

TEST_F(PersistenceManagerTest, RefusedPrimaryRemoveIsRetried) {
    manager->create_transfer_state(new_transfer("t"));
    ASSERT_TRUE(manager->flush("t"));

    primary->refuse_removes = true;
    EXPECT_FALSE(manager->remove_transfer_state("t"));
    ASSERT_TRUE(primary->get(key("t")).has_value());
    // The stale copy is not resurrected.
    EXPECT_FALSE(manager->load_transfer_state("t").has_value());
    EXPECT_FALSE(manager->can_resume_transfer("t"));
    EXPECT_EQ(manager->cleanup_old_states(), 0u);

    primary->refuse_removes = false;
    manager->create_transfer_state(new_transfer("other"));
    EXPECT_TRUE(manager->flush("other"));
    EXPECT_FALSE(primary->get(key("t")).has_value());
    EXPECT_TRUE(primary->get(key("other")).has_value());
}

TEST_F(PersistenceManagerTest, SavingAgainCancelsDeferredRemoval) {
    manager->create_transfer_state(new_transfer("t"));
    ASSERT_TRUE(manager->flush("t"));

    primary->refuse_removes = true;
    EXPECT_FALSE(manager->remove_transfer_state("t"));
    primary->refuse_removes = false;

    manager->create_transfer_state(new_transfer("t", 4));
    EXPECT_TRUE(manager->flush("t"));
    const auto stored = primary->get(key("t"));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->total_chunks, 4u);
}

TEST_F(PersistenceManagerTest, CleanupRemovesExpiredAndExhausted) {
    settings.max_state_age_ms = 60000;
    settings.max_resume_attempts = 3;
    make_manager();

    TransferState expired;
    expired.transfer_id = "expired";
    expired.last_update_time_ms = util::now_ms() - 120000;
    primary->records[key("expired")] = expired;

    TransferState exhausted;
    exhausted.transfer_id = "exhausted";
    exhausted.last_update_time_ms = util::now_ms();
    exhausted.resume_attempts = 3;
    fallback->records[key("exhausted")] = exhausted;

    TransferState other_role = expired;
    other_role.transfer_id = "sender-side";
    other_role.role = error::Role::Sender;
    primary->records[persistence::state_key(error::Role::Sender, "sender-side")] = other_role;

    manager->create_transfer_state(new_transfer("fresh"));

    EXPECT_EQ(manager->cleanup_old_states(), 2u);
    EXPECT_FALSE(manager->load_transfer_state("expired").has_value());
    EXPECT_FALSE(manager->load_transfer_state("exhausted").has_value());
    EXPECT_TRUE(manager->load_transfer_state("fresh").has_value());
    EXPECT_EQ(primary->records.count(persistence::state_key(error::Role::Sender, "sender-side")), 1u);
}

TEST_F(PersistenceManagerTest, CleanupKeepsNewestWithinLimit) {
    settings.max_stored_transfers = 2;
    make_manager();

    for (int i = 0; i < 4; ++i) {
        TransferState state;
        state.transfer_id = "t" + std::to_string(i);
        state.last_update_time_ms = util::now_ms() - (4 - i) * 1000;
        primary->records[key(state.transfer_id)] = state;
    }

    EXPECT_EQ(manager->cleanup_old_states(), 2u);
    EXPECT_FALSE(primary->get(key("t0")).has_value());
    EXPECT_FALSE(primary->get(key("t1")).has_value());
    EXPECT_TRUE(primary->get(key("t2")).has_value());
    EXPECT_TRUE(primary->get(key("t3")).has_value());
}

TEST_F(PersistenceManagerTest, CreateBuildsRealStores) {
    test_utils::TempDir dir;
    util::PersistenceSettings real;
    real.directory = dir.path().string();
    real.save_throttle_ms = 60000;

    auto created = PersistenceManager::create(executor, error::Role::Receiver, real);
    ASSERT_NE(created, nullptr);
    EXPECT_TRUE(created->primary_available());

    created->create_transfer_state(new_transfer("t"));
    ASSERT_TRUE(created->flush("t"));
    EXPECT_TRUE(std::filesystem::exists(dir / real.database));
}
