#include "receiver/chunk_storage.h"
#include "util/hash.h"
#include <spdlog/spdlog.h>

namespace receiver {

const char* to_string(FinalizeStatus status) {
    switch (status) {
    case FinalizeStatus::Ok:
        return "ok";
    case FinalizeStatus::HashMismatch:
        return "hash mismatch";
    case FinalizeStatus::SizeMismatch:
        return "size mismatch";
    case FinalizeStatus::StorageFailure:
        return "storage failure";
    }
    return "unknown";
}

StorageChoice select_storage(std::uint64_t file_size, const StorageCapabilities& caps) {
    if (file_size < caps.streaming_threshold) {
        return StorageChoice::Memory;
    }
    return caps.streaming_available ? StorageChoice::Streaming : StorageChoice::ConfirmMemory;
}

std::filesystem::path unique_destination(const std::filesystem::path& save_dir,
                                         const std::string& file_name) {
    auto name = std::filesystem::path(file_name).filename();
    if (name.empty() || name == "." || name == "..") {
        name = "received_file";
    }

    auto candidate = save_dir / name;
    std::error_code ec;
    const auto stem = name.stem().string();
    const auto extension = name.extension().string();
    for (int n = 1; std::filesystem::exists(candidate, ec); ++n) {
        candidate = save_dir / (stem + " (" + std::to_string(n) + ")" + extension);
    }
    return candidate;
}

bool MemoryChunkStorage::write_chunk(std::uint64_t index,
                                     std::uint64_t /*offset*/,
                                     ConstDataBlock data) {
    const auto [it, inserted] = chunks_.try_emplace(index, data.begin(), data.end());
    if (inserted) {
        bytes_ += data.size();
    }
    return true;
}

FinalizeResult MemoryChunkStorage::finalize(std::uint64_t total_chunks) {
    FinalizeResult result;

    ReceivedArtifact artifact;
    artifact.transfer_id = info_.transfer_id;
    artifact.file_name = info_.file_name;
    artifact.file_size = info_.file_size;
    artifact.method = persistence::StorageMethod::Memory;
    artifact.data.reserve(bytes_);

    util::hash::Sha256 hasher;
    for (std::uint64_t i = 0; i < total_chunks; ++i) {
        const auto it = chunks_.find(i);
        if (it == chunks_.end()) {
            result.status = FinalizeStatus::StorageFailure;
            result.message = "chunk " + std::to_string(i) + " missing at finalize";
            return result;
        }
        artifact.data.insert(artifact.data.end(), it->second.begin(), it->second.end());
        if (!info_.file_hash.empty() && !hasher.update(ConstDataBlock(it->second.data(), it->second.size()))) {
            result.status = FinalizeStatus::StorageFailure;
            result.message = "failed to hash assembled file";
            return result;
        }
    }

    if (artifact.data.size() != info_.file_size) {
        result.status = FinalizeStatus::SizeMismatch;
        result.message = "assembled " + std::to_string(artifact.data.size()) + " bytes, expected "
                         + std::to_string(info_.file_size);
        return result;
    }

    if (!info_.file_hash.empty()) {
        const auto digest = hasher.finish_hex();
        if (!digest) {
            result.status = FinalizeStatus::StorageFailure;
            result.message = "failed to hash assembled file";
            return result;
        }
        if (*digest != info_.file_hash) {
            spdlog::error("[MemoryChunkStorage::finalize] Hash mismatch for {}: expected {}, got {}",
                          info_.file_name,
                          info_.file_hash,
                          *digest);
            result.status = FinalizeStatus::HashMismatch;
            result.message = "file hash mismatch";
            return result;
        }
        artifact.hash_verified = true;
    }

    chunks_.clear();
    result.status = FinalizeStatus::Ok;
    result.artifact = std::move(artifact);
    return result;
}

void MemoryChunkStorage::abort(bool /*remove_partial*/) {
    chunks_.clear();
    bytes_ = 0;
}

StreamingChunkStorage::StreamingChunkStorage(FileInfo info, std::filesystem::path destination)
    : info_(std::move(info))
    , destination_(std::move(destination)) {}

bool StreamingChunkStorage::open(const std::set<std::uint64_t>* resumed_chunks,
                                 std::uint64_t resumed_bytes) {
    std::error_code ec;
    const auto parent = destination_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("[StreamingChunkStorage::open] Failed to create directories for {}: {}",
                          destination_.string(),
                          ec.message());
            return false;
        }
    }

    const bool resume = resumed_chunks != nullptr && std::filesystem::exists(destination_, ec);
    auto mode = std::ios::binary | std::ios::in | std::ios::out;
    if (!resume) {
        mode |= std::ios::trunc;
    }
    fs_.open(destination_, mode);
    if (!fs_.is_open()) {
        spdlog::error("[StreamingChunkStorage::open] Failed to open file: {}", destination_.string());
        return false;
    }

    written_.clear();
    bytes_ = 0;
    if (resume) {
        written_ = *resumed_chunks;
        bytes_ = resumed_bytes;
        spdlog::info("[StreamingChunkStorage::open] Resuming {} with {} chunks on disk",
                     destination_.string(),
                     written_.size());
    }
    return true;
}

bool StreamingChunkStorage::write_chunk(std::uint64_t index, std::uint64_t offset, ConstDataBlock data) {
    if (written_.contains(index)) {
        return true;
    }
    if (!fs_.is_open()) {
        fs_.open(destination_, std::ios::binary | std::ios::in | std::ios::out);
        if (!fs_.is_open()) {
            spdlog::error("[StreamingChunkStorage::write_chunk] Failed to reopen file: {}",
                          destination_.string());
            return false;
        }
    }
    if (offset + data.size() > info_.file_size) {
        spdlog::error("[StreamingChunkStorage::write_chunk] Chunk {} at {} overruns {} bytes",
                      index,
                      offset,
                      info_.file_size);
        return false;
    }

    fs_.clear();
    fs_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!fs_) {
        spdlog::error("[StreamingChunkStorage::write_chunk] Failed to seek to offset {} in {}",
                      offset,
                      destination_.string());
        return false;
    }
    fs_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!fs_) {
        spdlog::error("[StreamingChunkStorage::write_chunk] Failed to write chunk {} to {}",
                      index,
                      destination_.string());
        return false;
    }

    written_.insert(index);
    bytes_ += data.size();
    return true;
}

FinalizeResult StreamingChunkStorage::finalize(std::uint64_t total_chunks) {
    FinalizeResult result;
    for (std::uint64_t i = 0; i < total_chunks; ++i) {
        if (!written_.contains(i)) {
            result.status = FinalizeStatus::StorageFailure;
            result.message = "chunk " + std::to_string(i) + " missing at finalize";
            return result;
        }
    }

    if (fs_.is_open()) {
        fs_.flush();
        const bool flushed = static_cast<bool>(fs_);
        fs_.close();
        if (!flushed) {
            result.status = FinalizeStatus::StorageFailure;
            result.message = "failed to flush " + destination_.string();
            return result;
        }
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(destination_, ec);
    if (ec || size != info_.file_size) {
        result.status = FinalizeStatus::SizeMismatch;
        result.message = "file on disk has " + std::to_string(ec ? 0 : size) + " bytes, expected "
                         + std::to_string(info_.file_size);
        return result;
    }

    ReceivedArtifact artifact;
    artifact.transfer_id = info_.transfer_id;
    artifact.file_name = info_.file_name;
    artifact.file_size = info_.file_size;
    artifact.method = persistence::StorageMethod::Streaming;
    artifact.path = destination_;

    result.status = FinalizeStatus::Ok;
    result.artifact = std::move(artifact);
    return result;
}

void StreamingChunkStorage::abort(bool remove_partial) {
    if (fs_.is_open()) {
        fs_.close();
    }
    if (remove_partial) {
        std::error_code ec;
        std::filesystem::remove(destination_, ec);
        if (ec) {
            spdlog::warn("[StreamingChunkStorage::abort] Failed to remove {}: {}",
                         destination_.string(),
                         ec.message());
        }
    }
}

} // namespace receiver
