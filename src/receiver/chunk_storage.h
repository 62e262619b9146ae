#pragma once

#include "persistence/transfer_state.h"
#include "util/data_block.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace receiver {

// What a finished transfer hands to the application: the bytes in memory
// mode, the file path in streaming mode.
struct ReceivedArtifact {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    persistence::StorageMethod method = persistence::StorageMethod::Memory;
    ByteBuffer data;
    std::filesystem::path path;
    // True when the whole-file hash was checked against the sender's.
    bool hash_verified = false;
};

enum class FinalizeStatus { Ok, HashMismatch, SizeMismatch, StorageFailure };

const char* to_string(FinalizeStatus status);

struct FinalizeResult {
    FinalizeStatus status = FinalizeStatus::StorageFailure;
    std::string message;
    std::optional<ReceivedArtifact> artifact;
};

class ChunkStorage {
  public:
    virtual ~ChunkStorage() = default;

    virtual persistence::StorageMethod method() const = 0;

    // Stores one verified chunk. Storing an index twice keeps the bytes from
    // the first write. Returns false on an I/O failure.
    virtual bool write_chunk(std::uint64_t index, std::uint64_t offset, ConstDataBlock data) = 0;
    virtual bool has_chunk(std::uint64_t index) const = 0;
    virtual std::uint64_t bytes_stored() const = 0;

    // Requires chunks [0, total_chunks) to be present.
    virtual FinalizeResult finalize(std::uint64_t total_chunks) = 0;

    // Releases buffers and handles. remove_partial deletes what streaming
    // storage wrote so far.
    virtual void abort(bool remove_partial) = 0;
};

struct FileInfo {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string file_hash;
};

class MemoryChunkStorage : public ChunkStorage {
  public:
    explicit MemoryChunkStorage(FileInfo info)
        : info_(std::move(info)) {}

    persistence::StorageMethod method() const override { return persistence::StorageMethod::Memory; }
    bool write_chunk(std::uint64_t index, std::uint64_t offset, ConstDataBlock data) override;
    bool has_chunk(std::uint64_t index) const override { return chunks_.contains(index); }
    std::uint64_t bytes_stored() const override { return bytes_; }
    FinalizeResult finalize(std::uint64_t total_chunks) override;
    void abort(bool remove_partial) override;

  private:
    FileInfo info_;
    std::map<std::uint64_t, ByteBuffer> chunks_;
    std::uint64_t bytes_ = 0;
};

// Writes chunks at their offsets into a file under the save directory.
class StreamingChunkStorage : public ChunkStorage {
  public:
    StreamingChunkStorage(FileInfo info, std::filesystem::path destination);

    StreamingChunkStorage(const StreamingChunkStorage&) = delete;
    StreamingChunkStorage& operator=(const StreamingChunkStorage&) = delete;

    // Creates (or truncates) the destination. When resuming, an existing file
    // is kept and the given chunks count as already stored.
    bool open(const std::set<std::uint64_t>* resumed_chunks = nullptr,
              std::uint64_t resumed_bytes = 0);

    persistence::StorageMethod method() const override {
        return persistence::StorageMethod::Streaming;
    }
    bool write_chunk(std::uint64_t index, std::uint64_t offset, ConstDataBlock data) override;
    bool has_chunk(std::uint64_t index) const override { return written_.contains(index); }
    std::uint64_t bytes_stored() const override { return bytes_; }
    FinalizeResult finalize(std::uint64_t total_chunks) override;
    void abort(bool remove_partial) override;

    const std::filesystem::path& destination() const { return destination_; }

  private:
    FileInfo info_;
    std::filesystem::path destination_;
    std::fstream fs_;
    std::set<std::uint64_t> written_;
    std::uint64_t bytes_ = 0;
};

struct StorageCapabilities {
    bool streaming_available = true;
    std::uint64_t streaming_threshold = 100ULL * 1024 * 1024;
};

enum class StorageChoice {
    Memory,
    Streaming,
    // Too large for memory by policy and no streaming sink: ask the user.
    ConfirmMemory,
};

StorageChoice select_storage(std::uint64_t file_size, const StorageCapabilities& caps);

// save_dir / file name, with " (n)" appended before the extension when the
// name is taken. Only the last path component of file_name is used.
std::filesystem::path unique_destination(const std::filesystem::path& save_dir,
                                         const std::string& file_name);

} // namespace receiver
