#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

using namespace nlohmann;

namespace util {

struct ChunkingSettings {
    bool adaptive = true;
    std::size_t min_chunk_size = 8 * 1024;
    std::size_t max_chunk_size = 1024 * 1024;
    std::size_t default_chunk_size = 64 * 1024;
    double adaptation_rate = 0.2;
    double stability_threshold_ms = 10.0;
    std::size_t quality_window = 10;
    double target_rtt_ms = 100.0;
    double target_buffer_utilization = 0.7;
    double bandwidth_utilization_target = 0.85;
    // Buffer level treated as full when computing utilization.
    std::size_t buffer_capacity = 1024 * 1024;
    double oversize_reduction = 0.8;
    double min_change_ratio = 0.05;
    double min_confidence = 0.6;
};

struct PacingSettings {
    bool constrained_peer = false;
    std::size_t high_water_mark = 1024 * 1024;
    std::size_t constrained_high_water_mark = 512 * 1024;
    std::size_t low_threshold = 128 * 1024;
    std::size_t constrained_low_threshold = 64 * 1024;
    int wait_timeout_ms = 10000;
    int drain_poll_ms = 10;
    int drain_timeout_ms = 30000;
};

struct SenderSettings {
    int replan_interval = 5;
    int rtt_sample_interval = 10;
    int yield_interval = 10;
};

struct ReceiverSettings {
    std::string save_dir = "received";
    std::uint64_t streaming_threshold = 100ULL * 1024 * 1024;
    bool streaming_available = true;
    bool verify_streamed_files = false;
    int finalize_grace_ms = 200;
    int pending_start_timeout_ms = 1000;
    int pending_max_age_ms = 30000;
    int stall_timeout_ms = 30000;
    int max_finalize_rounds = 3;
    int max_chunk_retries = 3;
};

struct PersistenceSettings {
    bool enabled = true;
    std::string directory = "transfer_state";
    std::string database = "transfer_state.db";
    bool prefer_transactional = true;
    std::int64_t max_state_age_ms = 24LL * 60 * 60 * 1000;
    int max_resume_attempts = 3;
    int save_throttle_ms = 1000;
    std::size_t max_state_size = 1024 * 1024;
    std::size_t max_stored_transfers = 10;
    int max_primary_failures = 3;
    int primary_cooldown_ms = 30000;
    int recreation_cooldown_ms = 30000;
    std::int64_t cleanup_interval_ms = 60LL * 60 * 1000;
};

struct AckSettings {
    std::uint64_t small_file_threshold = 10ULL * 1024 * 1024;
    std::uint64_t medium_file_threshold = 100ULL * 1024 * 1024;
    int large_file_interval_ms = 500;
    int min_interval_ms = 200;
};

struct LoggingSettings {
    std::string level = "info";
};

struct TransferSettings {
    ChunkingSettings chunking;
    PacingSettings pacing;
    SenderSettings sender;
    ReceiverSettings receiver;
    PersistenceSettings persistence;
    AckSettings ack;
    LoggingSettings logging;

    // Missing keys keep their defaults.
    static TransferSettings from_json(const json& j);
    json to_json() const;
};

class Settings {
  public:
    static Settings& instance() {
        static Settings instance;
        return instance;
    }

    void init(const std::string& executable_path = "");

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    json& get() {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    const json& get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    TransferSettings transfer_settings() const;

    void save();

  private:
    Settings() = default;
    ~Settings() = default;

    void load();
    void create_default();
    void save_internal();

    std::string file_path_;
    json settings_;
    mutable std::mutex mutex_;
};
} // namespace util
