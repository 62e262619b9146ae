#include "progress/progress_tracker.h"
#include "progress/ack_coordinator.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace progress {

const char* to_string(TransferStatus status) {
    switch (status) {
    case TransferStatus::Pending:
        return "pending";
    case TransferStatus::Transferring:
        return "transferring";
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Error:
        return "error";
    case TransferStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* to_string(AckStatus status) {
    switch (status) {
    case AckStatus::Waiting:
        return "waiting";
    case AckStatus::Acknowledging:
        return "acknowledging";
    case AckStatus::Completed:
        return "completed";
    case AckStatus::Error:
        return "error";
    }
    return "unknown";
}

void ProgressTracker::start(const std::string& transfer_id,
                            const std::string& file_name,
                            std::uint64_t file_size) {
    TransferProgress p;
    p.transfer_id = transfer_id;
    p.file_name = file_name;
    p.file_size = file_size;
    p.status = TransferStatus::Pending;
    transfers_[transfer_id] = p;
    current_id_ = transfer_id;
    notify(p);
}

void ProgressTracker::update(const std::string& transfer_id, std::uint64_t bytes_transferred) {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    auto& p = it->second;
    if (p.status != TransferStatus::Pending && p.status != TransferStatus::Transferring) {
        return;
    }
    p.bytes_transferred = std::min(bytes_transferred, p.file_size);
    p.percentage = progress_percentage(p.bytes_transferred, p.file_size);
    p.status = TransferStatus::Transferring;
    notify(p);
}

void ProgressTracker::complete(const std::string& transfer_id) {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    auto& p = it->second;
    p.bytes_transferred = p.file_size;
    p.percentage = 100;
    p.status = TransferStatus::Completed;
    p.error.clear();
    notify(p);
}

void ProgressTracker::fail(const std::string& transfer_id, const std::string& message) {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    it->second.status = TransferStatus::Error;
    it->second.error = message;
    notify(it->second);
}

void ProgressTracker::cancel(const std::string& transfer_id) {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    it->second.status = TransferStatus::Cancelled;
    notify(it->second);
}

std::optional<TransferProgress> ProgressTracker::progress(const std::string& transfer_id) const {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransferProgress> ProgressTracker::current() const {
    return progress(current_id_);
}

std::vector<TransferProgress> ProgressTracker::all() const {
    std::vector<TransferProgress> out;
    out.reserve(transfers_.size());
    for (const auto& [id, p] : transfers_) {
        out.push_back(p);
    }
    return out;
}

void ProgressTracker::start_ack(const std::string& transfer_id,
                                const std::string& file_name,
                                std::uint64_t file_size) {
    AckProgress a;
    a.transfer_id = transfer_id;
    a.file_name = file_name;
    a.file_size = file_size;
    acks_[transfer_id] = a;
    current_ack_id_ = transfer_id;
    notify_ack(a);
}

void ProgressTracker::on_ack(const std::string& transfer_id, int percentage) {
    const auto it = acks_.find(transfer_id);
    if (it == acks_.end()) {
        spdlog::debug("[ProgressTracker::on_ack] ACK for untracked transfer {}", transfer_id);
        return;
    }
    auto& a = it->second;
    a.percentage = std::clamp(percentage, 0, 100);
    a.bytes_acknowledged = static_cast<std::uint64_t>(
        std::llround(static_cast<double>(a.percentage) / 100.0 * static_cast<double>(a.file_size)));
    a.status = a.percentage >= 100 ? AckStatus::Completed : AckStatus::Acknowledging;
    notify_ack(a);
}

void ProgressTracker::fail_ack(const std::string& transfer_id) {
    const auto it = acks_.find(transfer_id);
    if (it == acks_.end()) {
        return;
    }
    it->second.status = AckStatus::Error;
    notify_ack(it->second);
}

std::optional<AckProgress> ProgressTracker::ack(const std::string& transfer_id) const {
    const auto it = acks_.find(transfer_id);
    if (it == acks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AckProgress> ProgressTracker::current_ack() const {
    return ack(current_ack_id_);
}

void ProgressTracker::clear(const std::string& transfer_id) {
    transfers_.erase(transfer_id);
    acks_.erase(transfer_id);
}

void ProgressTracker::clear_finished() {
    std::erase_if(transfers_, [](const auto& entry) {
        const auto status = entry.second.status;
        return status == TransferStatus::Completed || status == TransferStatus::Error
               || status == TransferStatus::Cancelled;
    });
    std::erase_if(acks_, [](const auto& entry) {
        return entry.second.status == AckStatus::Completed
               || entry.second.status == AckStatus::Error;
    });
}

void ProgressTracker::clear_all() {
    transfers_.clear();
    acks_.clear();
    current_id_.clear();
    current_ack_id_.clear();
}

void ProgressTracker::notify(const TransferProgress& progress) {
    if (listener_) {
        listener_(progress);
    }
}

void ProgressTracker::notify_ack(const AckProgress& progress) {
    if (ack_listener_) {
        ack_listener_(progress);
    }
}

} // namespace progress
