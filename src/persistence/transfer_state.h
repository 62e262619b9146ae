#pragma once

#include "error/transfer_error.h"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace persistence {

enum class StorageMethod { Memory, Streaming };

const char* to_string(StorageMethod method);

// Resumable progress of one transfer, keyed by role and transfer id.
struct TransferState {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string file_hash;
    std::uint64_t total_chunks = 0;
    std::set<std::uint64_t> received_chunks;
    std::set<std::uint64_t> verified_chunks;
    std::map<std::uint64_t, std::string> chunk_hashes;
    std::uint64_t bytes_received = 0;
    std::int64_t start_time_ms = 0;
    std::int64_t last_update_time_ms = 0;
    error::Role role = error::Role::Receiver;
    std::uint64_t chunk_size = 64 * 1024;
    bool adaptive_chunking = true;
    std::string last_network_quality;
    double last_rtt_ms = 0.0;
    double last_bandwidth = 0.0;
    StorageMethod storage_method = StorageMethod::Memory;
    std::string destination_path;
    int resume_attempts = 0;
    std::int64_t last_resume_time_ms = 0;

    double received_fraction() const;
    std::vector<std::uint64_t> missing_chunks() const;
};

std::string state_key(error::Role role, const std::string& transfer_id);

nlohmann::json to_json(const TransferState& state);
// Nullopt when required fields are missing or mistyped.
std::optional<TransferState> state_from_json(const nlohmann::json& j);

} // namespace persistence
