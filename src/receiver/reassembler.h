#pragma once

#include "core/executor.h"
#include "error/error_classifier.h"
#include "error/retry_tracker.h"
#include "persistence/persistence_manager.h"
#include "progress/ack_coordinator.h"
#include "progress/progress_tracker.h"
#include "protocol/codec.h"
#include "receiver/chunk_storage.h"
#include "util/settings.h"
#include "wire.pb.h"
#include <asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace receiver {

enum class Phase { Initializing, Receiving, Finalizing, Complete, Failed };

const char* to_string(Phase phase);

struct ReceiverContext {
    core::Executor& executor;
    // Null when nothing is persisted.
    persistence::PersistenceManager* persistence;
    progress::ProgressTracker& progress;
    const progress::AckCoordinator& acks;
    error::ErrorClassifier& errors;
    error::RetryTracker& retries;
    util::ReceiverSettings settings;
};

struct FinalizeOutcome {
    bool completed = false;
    // Chunks that were requested again instead of completing.
    std::vector<std::uint64_t> missing;
    std::optional<error::StructuredError> error;
};

struct IncomingSnapshot {
    std::string transfer_id;
    std::string peer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t total_chunks = 0;
    std::uint64_t bytes_received = 0;
    std::size_t chunks_received = 0;
    std::size_t queued_frames = 0;
    Phase phase = Phase::Initializing;
    std::optional<persistence::StorageMethod> storage;
    int finalize_rounds = 0;
};

// Rebuilds incoming files. Every transfer is one state machine with its own
// FIFO of frames that arrived before it could accept them:
//   INITIALIZING -> RECEIVING -> FINALIZING -> COMPLETE | FAILED
// All calls happen on the io thread.
class Reassembler {
  public:
    // Sends one encoded frame back to a peer; false if it could not be queued.
    using ReplyFn = std::function<bool(const std::string& peer_id, ConstDataBlock frame)>;
    using ReceivedFn = std::function<void(const ReceivedArtifact&)>;
    // Asked before buffering a file in memory that policy says should be
    // streamed. Without one the transfer proceeds in memory.
    using ConfirmFn = std::function<asio::awaitable<bool>(const std::string& file_name,
                                                          std::uint64_t file_size)>;

    Reassembler(ReceiverContext context, ReplyFn reply);
    ~Reassembler();

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Routes START, DATA, END and ERROR frames.
    void handle_frame(const std::string& peer_id, const protocol::Frame& frame);

    void on_file_start(const std::string& peer_id,
                       const std::string& transfer_id,
                       const wire::FileStart& start);
    void on_chunk(const std::string& peer_id, const std::string& transfer_id, ConstDataBlock payload);
    void on_file_end(const std::string& peer_id,
                     const std::string& transfer_id,
                     const wire::FileEnd& end);
    void on_remote_error(const std::string& transfer_id, const wire::FileError& error);

    // Completes the transfer if every chunk is present, otherwise requests
    // the missing ones again. Gives up after max_finalize_rounds.
    FinalizeOutcome finalize(const std::string& transfer_id);

    bool cancel(const std::string& transfer_id);

    // Picks a stalled or failed transfer back up and asks the sender for the
    // chunks still missing. Works from the persisted record for streamed
    // files the arena no longer holds.
    bool resume(const std::string& transfer_id, const std::string& peer_id = {});

    // Ends every transfer that came from the peer.
    void on_peer_lost(const std::string& peer_id);

    std::optional<IncomingSnapshot> snapshot(const std::string& transfer_id) const;
    std::vector<IncomingSnapshot> snapshots() const;
    // Drops finished entries.
    void clear_finished();

    void on_file_received(ReceivedFn callback) { received_ = std::move(callback); }
    void set_confirmation(ConfirmFn confirm) { confirm_ = std::move(confirm); }

    StorageCapabilities capabilities() const;

  private:
    struct PendingFrame {
        std::uint32_t type = 0;
        ByteBuffer payload;
    };

    struct IncomingTransfer {
        std::string transfer_id;
        std::string peer_id;
        std::uint64_t generation = 0;
        Phase phase = Phase::Initializing;
        bool start_received = false;

        std::string file_name;
        std::uint64_t file_size = 0;
        std::string file_hash;
        std::uint64_t chunk_size = 0;
        std::uint64_t total_chunks = 0;
        bool total_final = false;

        std::unique_ptr<ChunkStorage> storage;
        std::filesystem::path destination;
        std::deque<PendingFrame> queue;
        std::set<std::uint64_t> received;
        std::uint64_t bytes_received = 0;

        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point last_progress;
        std::optional<int> last_acked_percentage;
        std::optional<std::chrono::steady_clock::time_point> last_ack_time;

        int finalize_rounds = 0;
        bool finalize_scheduled = false;
        bool watchdog_running = false;
        bool resumed = false;
    };

    IncomingTransfer* find(const std::string& transfer_id);
    const IncomingTransfer* find(const std::string& transfer_id) const;
    IncomingTransfer* find(const std::string& transfer_id, std::uint64_t generation);
    IncomingTransfer& create_pending(const std::string& peer_id, const std::string& transfer_id);

    void begin(IncomingTransfer& transfer, StorageChoice choice);
    // Clears resumed when its chunks cannot be reused.
    bool open_storage(IncomingTransfer& transfer,
                      persistence::StorageMethod method,
                      std::optional<persistence::TransferState>& resumed);
    void drain_queue(IncomingTransfer& transfer);
    void enqueue(IncomingTransfer& transfer, std::uint32_t type, ConstDataBlock payload);

    void accept_chunk(IncomingTransfer& transfer, ConstDataBlock payload);
    void reject_chunk(IncomingTransfer& transfer,
                      std::uint64_t chunk_index,
                      error::ErrorKind kind,
                      const std::string& message,
                      std::uint64_t data_size);
    void accept_end(IncomingTransfer& transfer, const wire::FileEnd& end);
    void complete(IncomingTransfer& transfer, ReceivedArtifact artifact);
    error::StructuredError fail(IncomingTransfer& transfer,
                                error::ErrorKind kind,
                                const std::string& message,
                                bool notify_sender,
                                bool keep_for_resume);
    void maybe_ack(IncomingTransfer& transfer);

    void send_resend(const IncomingTransfer& transfer, const std::vector<std::uint64_t>& indices);
    void send_error(const std::string& peer_id,
                    const std::string& transfer_id,
                    error::ErrorKind kind,
                    const std::string& message);
    // Cancellation from either side: partial data and the persisted record go.
    void abandon(const std::string& transfer_id, const std::string& reason, bool notify_sender);
    error::ErrorContext context_of(const IncomingTransfer& transfer) const;

    void schedule(std::chrono::milliseconds delay, std::function<void()> fn);
    void arm_watchdog(IncomingTransfer& transfer);
    void check_stall(const std::string& transfer_id, std::uint64_t generation);
    void check_pending_start(const std::string& transfer_id, std::uint64_t generation);
    void run_finalize(const std::string& transfer_id, std::uint64_t generation);
    asio::awaitable<void> confirm_memory(std::weak_ptr<bool> alive,
                                         std::string transfer_id,
                                         std::uint64_t generation,
                                         std::string file_name,
                                         std::uint64_t file_size);
    asio::awaitable<void> verify_streamed(std::weak_ptr<bool> alive,
                                          std::string transfer_id,
                                          std::uint64_t generation,
                                          ReceivedArtifact artifact);

    ReceiverContext ctx_;
    ReplyFn reply_;
    ReceivedFn received_;
    ConfirmFn confirm_;

    std::map<std::string, std::unique_ptr<IncomingTransfer>> transfers_;
    std::uint64_t next_generation_ = 1;
    // Deferred work checks this before touching the reassembler.
    std::shared_ptr<bool> alive_;
};

} // namespace receiver
