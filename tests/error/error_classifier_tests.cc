#include "error/error_classifier.h"
#include "error/retry_tracker.h"
#include "gtest/gtest.h"

using namespace error;

TEST(ErrorClassifierTest, SeverityByKind) {
    EXPECT_EQ(severity_of(ErrorKind::Integrity), Severity::High);
    EXPECT_EQ(severity_of(ErrorKind::Protocol), Severity::High);
    EXPECT_EQ(severity_of(ErrorKind::Network), Severity::Medium);
    EXPECT_EQ(severity_of(ErrorKind::Timeout), Severity::Medium);
    EXPECT_EQ(severity_of(ErrorKind::Validation), Severity::Medium);
    EXPECT_EQ(severity_of(ErrorKind::UserCancelled), Severity::Low);
    EXPECT_EQ(severity_of(ErrorKind::Storage), Severity::Critical);
    EXPECT_EQ(severity_of(ErrorKind::Permission), Severity::Critical);
}

TEST(ErrorClassifierTest, RetryableUnlessCancelledOrPermission) {
    EXPECT_TRUE(is_retryable(ErrorKind::Network));
    EXPECT_TRUE(is_retryable(ErrorKind::Integrity));
    EXPECT_FALSE(is_retryable(ErrorKind::UserCancelled));
    EXPECT_FALSE(is_retryable(ErrorKind::Permission));
}

TEST(ErrorClassifierTest, RecoveryStrategies) {
    const auto network = recovery_strategy(ErrorKind::Network);
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->action, RecoveryAction::Retry);
    EXPECT_EQ(network->max_attempts, 3);

    const auto timeout = recovery_strategy(ErrorKind::Timeout);
    ASSERT_TRUE(timeout.has_value());
    EXPECT_EQ(timeout->action, RecoveryAction::Reconnect);

    EXPECT_EQ(recovery_strategy(ErrorKind::Permission)->action, RecoveryAction::UserIntervention);
    const auto cancelled = recovery_strategy(ErrorKind::UserCancelled);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->action, RecoveryAction::Abort);
    EXPECT_EQ(cancelled->max_attempts, 0);
    EXPECT_FALSE(recovery_strategy(ErrorKind::Storage).has_value());
    EXPECT_FALSE(recovery_strategy(ErrorKind::Validation).has_value());
}

TEST(ErrorClassifierTest, BackoffDoubles) {
    const auto strategy = *recovery_strategy(ErrorKind::Network);
    EXPECT_EQ(backoff_delay(strategy, 1), std::chrono::milliseconds(1000));
    EXPECT_EQ(backoff_delay(strategy, 2), std::chrono::milliseconds(2000));
    EXPECT_EQ(backoff_delay(strategy, 3), std::chrono::milliseconds(4000));
}

TEST(ErrorClassifierTest, CreateErrorRecordsHistory) {
    ErrorClassifier classifier(Role::Receiver);
    ErrorContext context;
    context.chunk_index = 4;
    context.file_name = "a.bin";

    const auto err = classifier.create_error("t1", ErrorKind::Integrity, "chunk 4 hash mismatch", context);
    EXPECT_EQ(err.kind, ErrorKind::Integrity);
    EXPECT_EQ(err.severity, Severity::High);
    EXPECT_TRUE(err.retryable);
    EXPECT_EQ(err.transfer_id, "t1");
    EXPECT_EQ(err.context.role, Role::Receiver);
    EXPECT_EQ(err.context.chunk_index, 4u);
    EXPECT_EQ(err.correlation_id.rfind("receiver_", 0), 0u);
    EXPECT_GT(err.timestamp_ms, 0);

    classifier.create_error("t1", ErrorKind::Network, "link down");
    ASSERT_EQ(classifier.error_history("t1").size(), 2u);
    EXPECT_EQ(classifier.error_history("t1")[1].kind, ErrorKind::Network);
    EXPECT_TRUE(classifier.error_history("unknown").empty());
}

TEST(ErrorClassifierTest, CorrelationIdsAreUnique) {
    ErrorClassifier classifier(Role::Sender);
    const auto a = classifier.create_error("t", ErrorKind::Network, "a");
    const auto b = classifier.create_error("t", ErrorKind::Network, "b");
    EXPECT_NE(a.correlation_id, b.correlation_id);
    EXPECT_EQ(a.correlation_id.rfind("sender_", 0), 0u);
}

TEST(ErrorClassifierTest, MetricsLifecycle) {
    ErrorClassifier classifier(Role::Sender);
    EXPECT_FALSE(classifier.metrics("t").has_value());

    classifier.start_transfer("t");
    classifier.update_metrics("t", {.bytes_transferred = 4096, .chunks_transferred = 1});
    classifier.update_metrics("t", {.bytes_transferred = 8192, .chunks_transferred = 1});
    classifier.update_metrics("t", {.chunks_retried = 1});
    classifier.update_metrics("t", {.integrity_checks_failed = 1});

    auto metrics = classifier.metrics("t");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->bytes_transferred, 8192u);
    EXPECT_EQ(metrics->chunks_transferred, 2u);
    EXPECT_EQ(metrics->chunks_retried, 1u);
    EXPECT_EQ(metrics->integrity_checks_failed, 1u);
    EXPECT_GT(metrics->average_speed, 0.0);
    EXPECT_GE(metrics->peak_speed, metrics->average_speed);
    EXPECT_EQ(metrics->final_status, FinalStatus::Active);
    EXPECT_EQ(classifier.active_transfers(), std::vector<std::string>{"t"});

    const auto err = classifier.create_error("t", ErrorKind::Timeout, "stalled");
    classifier.complete_transfer("t", FinalStatus::Failed, err);
    metrics = classifier.metrics("t");
    EXPECT_EQ(metrics->final_status, FinalStatus::Failed);
    ASSERT_TRUE(metrics->end_time_ms.has_value());
    ASSERT_TRUE(metrics->final_error.has_value());
    EXPECT_EQ(metrics->final_error->kind, ErrorKind::Timeout);
    EXPECT_TRUE(classifier.active_transfers().empty());

    classifier.cleanup("t");
    EXPECT_FALSE(classifier.metrics("t").has_value());
    EXPECT_TRUE(classifier.error_history("t").empty());
}

TEST(ErrorClassifierTest, UpdatesForUnknownTransferAreIgnored) {
    ErrorClassifier classifier(Role::Receiver);
    classifier.update_metrics("missing", {.chunks_transferred = 1});
    classifier.complete_transfer("missing", FinalStatus::Completed);
    EXPECT_FALSE(classifier.metrics("missing").has_value());
}

TEST(RetryTrackerTest, CountsPerChunk) {
    RetryTracker tracker(2);
    EXPECT_TRUE(tracker.should_retry("t", 5));
    EXPECT_EQ(tracker.add("t", 5), 1);
    EXPECT_TRUE(tracker.should_retry("t", 5));
    EXPECT_EQ(tracker.add("t", 5), 2);
    EXPECT_FALSE(tracker.should_retry("t", 5));

    EXPECT_EQ(tracker.retry_count("t", 6), 0);
    EXPECT_EQ(tracker.retry_count("other", 5), 0);
}

TEST(RetryTrackerTest, PendingAndClear) {
    RetryTracker tracker;
    tracker.add("a", 1);
    tracker.add("a", 7);
    tracker.add("b", 2);

    EXPECT_EQ(tracker.pending("a"), (std::vector<std::uint64_t>{1, 7}));
    tracker.remove("a", 1);
    EXPECT_EQ(tracker.pending("a"), (std::vector<std::uint64_t>{7}));

    tracker.clear("a");
    EXPECT_TRUE(tracker.pending("a").empty());
    EXPECT_EQ(tracker.pending("b"), (std::vector<std::uint64_t>{2}));
}
