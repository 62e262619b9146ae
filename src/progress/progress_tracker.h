#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace progress {

enum class TransferStatus { Pending, Transferring, Completed, Error, Cancelled };
enum class AckStatus { Waiting, Acknowledging, Completed, Error };

const char* to_string(TransferStatus status);
const char* to_string(AckStatus status);

struct TransferProgress {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t bytes_transferred = 0;
    int percentage = 0;
    TransferStatus status = TransferStatus::Pending;
    std::string error;
};

struct AckProgress {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    int percentage = 0;
    std::uint64_t bytes_acknowledged = 0;
    AckStatus status = AckStatus::Waiting;
};

// Byte-based progress snapshots for both directions. Chunk-count estimates
// never show up here.
class ProgressTracker {
  public:
    using Listener = std::function<void(const TransferProgress&)>;
    using AckListener = std::function<void(const AckProgress&)>;

    void start(const std::string& transfer_id, const std::string& file_name, std::uint64_t file_size);
    void update(const std::string& transfer_id, std::uint64_t bytes_transferred);
    void complete(const std::string& transfer_id);
    void fail(const std::string& transfer_id, const std::string& message);
    void cancel(const std::string& transfer_id);

    std::optional<TransferProgress> progress(const std::string& transfer_id) const;
    // The most recently started transfer.
    std::optional<TransferProgress> current() const;
    std::vector<TransferProgress> all() const;

    void start_ack(const std::string& transfer_id,
                   const std::string& file_name,
                   std::uint64_t file_size);
    void on_ack(const std::string& transfer_id, int percentage);
    void fail_ack(const std::string& transfer_id);
    std::optional<AckProgress> ack(const std::string& transfer_id) const;
    std::optional<AckProgress> current_ack() const;

    void clear(const std::string& transfer_id);
    void clear_finished();
    void clear_all();

    void on_progress(Listener listener) { listener_ = std::move(listener); }
    void on_ack_progress(AckListener listener) { ack_listener_ = std::move(listener); }

  private:
    void notify(const TransferProgress& progress);
    void notify_ack(const AckProgress& progress);

    std::map<std::string, TransferProgress> transfers_;
    std::map<std::string, AckProgress> acks_;
    std::string current_id_;
    std::string current_ack_id_;
    Listener listener_;
    AckListener ack_listener_;
};

} // namespace progress
