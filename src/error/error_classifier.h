#pragma once

#include "error/transfer_error.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace error {

Severity severity_of(ErrorKind kind);
bool is_retryable(ErrorKind kind);

enum class RecoveryAction { Retry, Reconnect, Restart, Abort, UserIntervention };

const char* to_string(RecoveryAction action);

struct RecoveryStrategy {
    RecoveryAction action = RecoveryAction::Abort;
    std::chrono::milliseconds delay{0};
    int max_attempts = 0;
};

// USER_CANCELLED maps to Abort and PERMISSION to UserIntervention, both with
// no attempts. VALIDATION and STORAGE have no strategy and yield nullopt.
std::optional<RecoveryStrategy> recovery_strategy(ErrorKind kind);

// Delay before the given 1-based attempt; doubles each time.
std::chrono::milliseconds backoff_delay(const RecoveryStrategy& strategy, int attempt);

enum class FinalStatus { Active, Completed, Failed, Cancelled };

struct TransferMetrics {
    std::string correlation_id;
    std::int64_t start_time_ms = 0;
    std::optional<std::int64_t> end_time_ms;
    std::uint64_t bytes_transferred = 0;
    double average_speed = 0.0;
    double peak_speed = 0.0;
    std::uint64_t chunks_transferred = 0;
    std::uint64_t chunks_retried = 0;
    std::uint64_t chunks_failed = 0;
    std::uint64_t integrity_checks_passed = 0;
    std::uint64_t integrity_checks_failed = 0;
    FinalStatus final_status = FinalStatus::Active;
    std::optional<StructuredError> final_error;
};

struct MetricsUpdate {
    std::optional<std::uint64_t> bytes_transferred;
    std::uint64_t chunks_transferred = 0;
    std::uint64_t chunks_retried = 0;
    std::uint64_t chunks_failed = 0;
    std::uint64_t integrity_checks_passed = 0;
    std::uint64_t integrity_checks_failed = 0;
};

// Turns failures into structured errors, keeps their history per transfer
// and tracks transfer metrics. Runs on the io thread.
class ErrorClassifier {
  public:
    explicit ErrorClassifier(Role role)
        : role_(role) {}

    ErrorClassifier(const ErrorClassifier&) = delete;
    ErrorClassifier& operator=(const ErrorClassifier&) = delete;

    StructuredError create_error(const std::string& transfer_id,
                                 ErrorKind kind,
                                 std::string message,
                                 ErrorContext context = {});

    const std::vector<StructuredError>& error_history(const std::string& transfer_id) const;

    std::string start_transfer(const std::string& transfer_id);
    void update_metrics(const std::string& transfer_id, const MetricsUpdate& update);
    void complete_transfer(const std::string& transfer_id,
                           FinalStatus status,
                           std::optional<StructuredError> final_error = std::nullopt);
    std::optional<TransferMetrics> metrics(const std::string& transfer_id) const;
    std::vector<std::string> active_transfers() const;

    void cleanup(const std::string& transfer_id);

  private:
    std::string make_correlation_id() const;

    Role role_;
    std::map<std::string, std::vector<StructuredError>> history_;
    std::map<std::string, TransferMetrics> metrics_;
};

} // namespace error
