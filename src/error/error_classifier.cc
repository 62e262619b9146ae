#include "error/error_classifier.h"
#include "util/time.h"
#include "util/uuid.h"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace error {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return "VALIDATION";
    case ErrorKind::Integrity:
        return "INTEGRITY";
    case ErrorKind::Storage:
        return "STORAGE";
    case ErrorKind::Protocol:
        return "PROTOCOL";
    case ErrorKind::Network:
        return "NETWORK";
    case ErrorKind::Timeout:
        return "TIMEOUT";
    case ErrorKind::UserCancelled:
        return "USER_CANCELLED";
    case ErrorKind::Permission:
        return "PERMISSION";
    }
    return "UNKNOWN";
}

const char* to_string(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    case Severity::Critical:
        return "critical";
    }
    return "unknown";
}

const char* to_string(Role role) {
    return role == Role::Sender ? "sender" : "receiver";
}

const char* to_string(RecoveryAction action) {
    switch (action) {
    case RecoveryAction::Retry:
        return "retry";
    case RecoveryAction::Reconnect:
        return "reconnect";
    case RecoveryAction::Restart:
        return "restart";
    case RecoveryAction::Abort:
        return "abort";
    case RecoveryAction::UserIntervention:
        return "user_intervention";
    }
    return "unknown";
}

Severity severity_of(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Integrity:
    case ErrorKind::Protocol:
        return Severity::High;
    case ErrorKind::Network:
    case ErrorKind::Timeout:
    case ErrorKind::Validation:
        return Severity::Medium;
    case ErrorKind::UserCancelled:
        return Severity::Low;
    case ErrorKind::Permission:
    case ErrorKind::Storage:
        return Severity::Critical;
    }
    return Severity::Medium;
}

bool is_retryable(ErrorKind kind) {
    return kind != ErrorKind::UserCancelled && kind != ErrorKind::Permission;
}

std::optional<RecoveryStrategy> recovery_strategy(ErrorKind kind) {
    using std::chrono::milliseconds;
    switch (kind) {
    case ErrorKind::Network:
        return RecoveryStrategy{RecoveryAction::Retry, milliseconds(1000), 3};
    case ErrorKind::Integrity:
        return RecoveryStrategy{RecoveryAction::Retry, milliseconds(500), 2};
    case ErrorKind::Timeout:
        return RecoveryStrategy{RecoveryAction::Reconnect, milliseconds(2000), 3};
    case ErrorKind::Protocol:
        return RecoveryStrategy{RecoveryAction::Restart, milliseconds(1000), 2};
    case ErrorKind::UserCancelled:
        return RecoveryStrategy{RecoveryAction::Abort, milliseconds(0), 0};
    case ErrorKind::Permission:
        return RecoveryStrategy{RecoveryAction::UserIntervention, milliseconds(0), 0};
    default:
        return std::nullopt;
    }
}

std::chrono::milliseconds backoff_delay(const RecoveryStrategy& strategy, int attempt) {
    const int shift = std::clamp(attempt - 1, 0, 16);
    return strategy.delay * (1 << shift);
}

StructuredError ErrorClassifier::create_error(const std::string& transfer_id,
                                              ErrorKind kind,
                                              std::string message,
                                              ErrorContext context) {
    StructuredError err;
    err.correlation_id = make_correlation_id();
    err.transfer_id = transfer_id;
    err.timestamp_ms = util::now_ms();
    err.kind = kind;
    err.severity = severity_of(kind);
    err.message = std::move(message);
    err.retryable = is_retryable(kind);
    err.context = std::move(context);
    err.context.role = role_;

    switch (err.severity) {
    case Severity::Critical:
    case Severity::High:
        spdlog::error("[ErrorClassifier::create_error] {} {} ({}): {}",
                      to_string(kind),
                      transfer_id,
                      err.correlation_id,
                      err.message);
        break;
    case Severity::Medium:
        spdlog::warn("[ErrorClassifier::create_error] {} {} ({}): {}",
                     to_string(kind),
                     transfer_id,
                     err.correlation_id,
                     err.message);
        break;
    case Severity::Low:
        spdlog::info("[ErrorClassifier::create_error] {} {}: {}",
                     to_string(kind),
                     transfer_id,
                     err.message);
        break;
    }

    history_[transfer_id].push_back(err);
    return err;
}

const std::vector<StructuredError>& ErrorClassifier::error_history(
    const std::string& transfer_id) const {
    static const std::vector<StructuredError> kEmpty;
    const auto it = history_.find(transfer_id);
    return it == history_.end() ? kEmpty : it->second;
}

std::string ErrorClassifier::start_transfer(const std::string& transfer_id) {
    TransferMetrics m;
    m.correlation_id = make_correlation_id();
    m.start_time_ms = util::now_ms();
    metrics_[transfer_id] = m;
    return m.correlation_id;
}

void ErrorClassifier::update_metrics(const std::string& transfer_id, const MetricsUpdate& update) {
    const auto it = metrics_.find(transfer_id);
    if (it == metrics_.end()) {
        return;
    }
    auto& m = it->second;

    if (update.bytes_transferred) {
        const auto now = util::now_ms();
        const auto elapsed_ms = std::max<std::int64_t>(now - m.start_time_ms, 1);
        m.bytes_transferred = *update.bytes_transferred;
        m.average_speed = static_cast<double>(m.bytes_transferred) * 1000.0
                          / static_cast<double>(elapsed_ms);
        m.peak_speed = std::max(m.peak_speed, m.average_speed);
    }
    m.chunks_transferred += update.chunks_transferred;
    m.chunks_retried += update.chunks_retried;
    m.chunks_failed += update.chunks_failed;
    m.integrity_checks_passed += update.integrity_checks_passed;
    m.integrity_checks_failed += update.integrity_checks_failed;
}

void ErrorClassifier::complete_transfer(const std::string& transfer_id,
                                        FinalStatus status,
                                        std::optional<StructuredError> final_error) {
    const auto it = metrics_.find(transfer_id);
    if (it == metrics_.end()) {
        return;
    }
    auto& m = it->second;
    m.end_time_ms = util::now_ms();
    m.final_status = status;
    m.final_error = std::move(final_error);

    const auto duration_ms = std::max<std::int64_t>(*m.end_time_ms - m.start_time_ms, 1);
    spdlog::info("[ErrorClassifier::complete_transfer] {} finished as {} after {} ms, {} bytes, "
                 "{} chunks ({} retried, {} failed)",
                 transfer_id,
                 status == FinalStatus::Completed   ? "completed"
                 : status == FinalStatus::Cancelled ? "cancelled"
                                                    : "failed",
                 duration_ms,
                 m.bytes_transferred,
                 m.chunks_transferred,
                 m.chunks_retried,
                 m.chunks_failed);
}

std::optional<TransferMetrics> ErrorClassifier::metrics(const std::string& transfer_id) const {
    const auto it = metrics_.find(transfer_id);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ErrorClassifier::active_transfers() const {
    std::vector<std::string> ids;
    for (const auto& [id, m] : metrics_) {
        if (m.final_status == FinalStatus::Active) {
            ids.push_back(id);
        }
    }
    return ids;
}

void ErrorClassifier::cleanup(const std::string& transfer_id) {
    history_.erase(transfer_id);
    metrics_.erase(transfer_id);
}

std::string ErrorClassifier::make_correlation_id() const {
    return fmt::format("{}_{}_{}", to_string(role_), util::now_ms(), util::generate_token());
}

} // namespace error
