#include "persistence/transfer_state.h"
#include <spdlog/spdlog.h>

namespace persistence {

const char* to_string(StorageMethod method) {
    return method == StorageMethod::Streaming ? "streaming" : "memory";
}

double TransferState::received_fraction() const {
    if (total_chunks == 0) {
        return 0.0;
    }
    return static_cast<double>(received_chunks.size()) / static_cast<double>(total_chunks);
}

std::vector<std::uint64_t> TransferState::missing_chunks() const {
    std::vector<std::uint64_t> missing;
    for (std::uint64_t i = 0; i < total_chunks; ++i) {
        if (!received_chunks.contains(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::string state_key(error::Role role, const std::string& transfer_id) {
    return std::string("file_transfer_state_") + error::to_string(role) + "_" + transfer_id;
}

nlohmann::json to_json(const TransferState& state) {
    nlohmann::json hashes = nlohmann::json::array();
    for (const auto& [index, hash] : state.chunk_hashes) {
        hashes.push_back({index, hash});
    }

    return {
        {"transferId", state.transfer_id},
        {"fileName", state.file_name},
        {"fileSize", state.file_size},
        {"fileHash", state.file_hash},
        {"totalChunks", state.total_chunks},
        {"receivedChunks", state.received_chunks},
        {"verifiedChunks", state.verified_chunks},
        {"chunkHashes", hashes},
        {"bytesReceived", state.bytes_received},
        {"startTime", state.start_time_ms},
        {"lastUpdateTime", state.last_update_time_ms},
        {"role", error::to_string(state.role)},
        {"chunkSize", state.chunk_size},
        {"adaptiveChunking", state.adaptive_chunking},
        {"lastNetworkQuality", state.last_network_quality},
        {"lastRTT", state.last_rtt_ms},
        {"lastBandwidth", state.last_bandwidth},
        {"storageMethod", to_string(state.storage_method)},
        {"destinationPath", state.destination_path},
        {"resumeAttempts", state.resume_attempts},
        {"lastResumeTime", state.last_resume_time_ms},
    };
}

std::optional<TransferState> state_from_json(const nlohmann::json& j) {
    try {
        TransferState state;
        state.transfer_id = j.at("transferId").get<std::string>();
        state.file_name = j.at("fileName").get<std::string>();
        state.file_size = j.at("fileSize").get<std::uint64_t>();
        state.total_chunks = j.at("totalChunks").get<std::uint64_t>();
        state.received_chunks = j.at("receivedChunks").get<std::set<std::uint64_t>>();
        state.bytes_received = j.at("bytesReceived").get<std::uint64_t>();
        state.start_time_ms = j.at("startTime").get<std::int64_t>();
        state.last_update_time_ms = j.at("lastUpdateTime").get<std::int64_t>();
        state.role = j.at("role").get<std::string>() == "sender" ? error::Role::Sender
                                                                 : error::Role::Receiver;

        state.file_hash = j.value("fileHash", std::string());
        state.verified_chunks = j.value("verifiedChunks", std::set<std::uint64_t>());
        if (j.contains("chunkHashes")) {
            for (const auto& pair : j.at("chunkHashes")) {
                state.chunk_hashes[pair.at(0).get<std::uint64_t>()] = pair.at(1).get<std::string>();
            }
        }
        state.chunk_size = j.value("chunkSize", std::uint64_t{64 * 1024});
        state.adaptive_chunking = j.value("adaptiveChunking", true);
        state.last_network_quality = j.value("lastNetworkQuality", std::string());
        state.last_rtt_ms = j.value("lastRTT", 0.0);
        state.last_bandwidth = j.value("lastBandwidth", 0.0);
        state.storage_method = j.value("storageMethod", std::string("memory")) == "streaming"
                                   ? StorageMethod::Streaming
                                   : StorageMethod::Memory;
        state.destination_path = j.value("destinationPath", std::string());
        state.resume_attempts = j.value("resumeAttempts", 0);
        state.last_resume_time_ms = j.value("lastResumeTime", std::int64_t{0});
        return state;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[persistence::state_from_json] Discarding malformed record: {}", e.what());
        return std::nullopt;
    }
}

} // namespace persistence
