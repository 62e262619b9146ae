#pragma once

#include "core/channel.h"
#include "core/executor.h"
#include "error/error_classifier.h"
#include "progress/progress_tracker.h"
#include "sender/chunk_planner.h"
#include "sender/network_monitor.h"
#include "sender/pacer.h"
#include "util/settings.h"
#include "wire.pb.h"
#include <asio/awaitable.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sender {

enum class SendStatus { Pending, Sending, Sent, Failed, Cancelled };

const char* to_string(SendStatus status);

struct SendResult {
    std::string transfer_id;
    SendStatus status = SendStatus::Pending;
    std::uint64_t total_chunks = 0;
    std::uint64_t bytes_sent = 0;
    std::optional<error::StructuredError> error;
};

// Collaborators shared by every outgoing transfer of one peer.
struct SenderContext {
    core::Executor& executor;
    TransmissionPacer& pacer;
    ChunkPlanner& planner;
    NetworkMonitor& monitor;
    progress::ProgressTracker& progress;
    error::ErrorClassifier& errors;
    util::SenderSettings settings;
};

// Streams one file as START, DATA..., END to every target channel. Chunk
// order is strictly sequential; the next chunk is only produced after the
// pacer lets the previous one through.
class FileSender {
  public:
    FileSender(SenderContext context,
               std::vector<std::shared_ptr<core::Channel>> targets,
               std::filesystem::path file_path,
               std::string transfer_id);

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    asio::awaitable<SendResult> send_file();

    // Re-sends recorded chunks by index, then repeats END. A failed transfer
    // is picked up again this way.
    asio::awaitable<void> resend_chunks(std::vector<std::uint64_t> chunk_indices);

    void on_ack(const wire::FileAck& ack,
                std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Cooperative; the pipeline stops before its next chunk or pacing wait.
    // Receivers are told right away.
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // The receiver behind peer_id gave up. Stops the transfer once no other
    // target is left.
    void on_remote_error(const std::string& peer_id, const wire::FileError& error);

    // The pipeline fails with a network error once no target is left.
    void remove_target(const std::string& peer_id);
    // Swaps in a new channel to the same peer, e.g. after a reconnect.
    void replace_target(std::shared_ptr<core::Channel> channel);
    bool targets(const std::string& peer_id) const;

    const std::string& transfer_id() const { return transfer_id_; }
    const std::string& file_name() const { return file_name_; }
    SendStatus status() const { return status_; }
    std::uint64_t total_chunks() const { return chunks_.size(); }

  private:
    struct ChunkInfo {
        std::uint64_t offset = 0;
        std::uint32_t size = 0;
        std::string hash;
        std::chrono::steady_clock::time_point sent_at;
        bool rtt_sampled = false;
    };

    struct Failure {
        error::ErrorKind kind;
        std::string message;
    };

    std::optional<ByteBuffer> read_chunk(std::ifstream& in, std::uint64_t offset, std::size_t size);
    void send_to_targets(ConstDataBlock frame);
    void send_start(const std::string& file_hash);
    void send_end();
    void send_error(const error::StructuredError& err);
    asio::awaitable<void> pace_targets();
    std::size_t channel_chunk_limit() const;
    SendResult fail(error::ErrorKind kind, const std::string& message);
    SendResult finish_remote_failure();
    SendResult finish_cancelled();

    SenderContext ctx_;
    std::vector<std::shared_ptr<core::Channel>> targets_;
    std::filesystem::path file_path_;
    std::string transfer_id_;
    std::string file_name_;
    std::uint64_t file_size_ = 0;
    std::vector<ChunkInfo> chunks_;
    std::uint64_t bytes_sent_ = 0;
    std::chrono::steady_clock::time_point started_at_;
    SendStatus status_ = SendStatus::Pending;
    bool announced_ = false;
    std::optional<Failure> remote_failure_;
    std::atomic<bool> cancelled_{false};
};

} // namespace sender
