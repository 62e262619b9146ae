#pragma once

#include "core/channel.h"
#include "core/executor.h"
#include "error/error_classifier.h"
#include "error/retry_tracker.h"
#include "persistence/persistence_manager.h"
#include "progress/ack_coordinator.h"
#include "progress/progress_tracker.h"
#include "receiver/reassembler.h"
#include "sender/chunk_planner.h"
#include "sender/file_sender.h"
#include "sender/network_monitor.h"
#include "sender/pacer.h"
#include "util/settings.h"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transfer {

// Entry point for both directions. Owns the peers' channels, one FileSender
// per outgoing transfer and the reassembler for incoming ones, and routes
// every frame by message type. Must be used from the executor's io thread
// and outlive the executor run.
class TransferManager {
  public:
    TransferManager(core::Executor& executor, util::TransferSettings settings);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Starts periodic persistence cleanup.
    void start();
    // Cancels outgoing transfers and flushes persisted state.
    void stop();

    void add_peer(std::shared_ptr<core::Channel> channel);
    void remove_peer(const std::string& peer_id);
    std::vector<std::string> peers() const;

    // Sends to target_peer, or to every connected peer. Returns the transfer
    // id, or nullopt when there is nobody to send to.
    std::optional<std::string> send_file(const std::filesystem::path& file,
                                         const std::optional<std::string>& target_peer = std::nullopt);

    // Without an id every active transfer is cancelled.
    bool cancel_transfer(const std::optional<std::string>& transfer_id = std::nullopt);
    // Forgets finished transfers; without an id all of them.
    void clear_transfer(const std::optional<std::string>& transfer_id = std::nullopt);

    // Without an id the most recently started transfer.
    std::optional<progress::TransferProgress>
    transfer_progress(const std::optional<std::string>& transfer_id = std::nullopt) const;
    std::optional<progress::AckProgress>
    ack_progress(const std::optional<std::string>& transfer_id = std::nullopt) const;

    std::size_t current_chunk_size() const { return planner_.current_chunk_size(); }

    // Outgoing: repeats END so the receiver asks for what it lacks.
    // Incoming: asks the sender for the missing chunks.
    bool resume_transfer(const std::string& transfer_id);
    bool can_resume_transfer(const std::string& transfer_id);
    std::vector<std::uint64_t> missing_chunks(const std::string& transfer_id);

    std::vector<error::StructuredError> error_history(const std::string& transfer_id) const;
    std::optional<error::TransferMetrics> transfer_metrics(const std::string& transfer_id) const;
    sender::NetworkMetrics network_metrics() const { return monitor_.metrics(); }

    std::optional<receiver::IncomingSnapshot> incoming(const std::string& transfer_id) const;
    std::optional<sender::SendStatus> outgoing(const std::string& transfer_id) const;

    // May clear or cancel transfers from inside the callback.
    void on_file_received(receiver::Reassembler::ReceivedFn callback);
    // Runs on the io thread after the update that triggered it.
    void on_progress(progress::ProgressTracker::Listener listener);
    void set_confirmation(receiver::Reassembler::ConfirmFn confirm);

    const util::TransferSettings& settings() const { return settings_; }

  private:
    void handle_message(const std::string& peer_id, ConstDataBlock message);
    bool reply(const std::string& peer_id, ConstDataBlock frame);
    std::shared_ptr<sender::FileSender> find_sender(const std::string& transfer_id) const;
    void spawn_resend(std::shared_ptr<sender::FileSender> file_sender, std::vector<std::uint64_t> indices);
    sender::SenderContext sender_context();

    core::Executor& executor_;
    util::TransferSettings settings_;

    progress::ProgressTracker progress_;
    progress::AckCoordinator acks_;
    error::ErrorClassifier sender_errors_;
    error::ErrorClassifier receiver_errors_;
    error::RetryTracker retries_;
    sender::NetworkMonitor monitor_;
    sender::ChunkPlanner planner_;
    sender::TransmissionPacer pacer_;
    std::unique_ptr<persistence::PersistenceManager> persistence_;
    std::unique_ptr<receiver::Reassembler> reassembler_;

    std::map<std::string, std::shared_ptr<core::Channel>> peers_;
    std::map<std::string, std::shared_ptr<sender::FileSender>> senders_;
};

} // namespace transfer
