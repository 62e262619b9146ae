#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace error {

enum class ErrorKind : std::uint32_t {
    Validation = 1,
    Integrity,
    Storage,
    Protocol,
    Network,
    Timeout,
    UserCancelled,
    Permission,
};

enum class Severity { Low, Medium, High, Critical };

enum class Role { Sender, Receiver };

const char* to_string(ErrorKind kind);
const char* to_string(Severity severity);
const char* to_string(Role role);

struct ErrorContext {
    Role role = Role::Receiver;
    std::string file_name;
    std::optional<std::uint64_t> file_size;
    std::optional<std::uint64_t> chunk_index;
    std::optional<std::uint64_t> total_chunks;
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<std::uint64_t> data_size;
};

struct StructuredError {
    std::string correlation_id;
    std::string transfer_id;
    std::int64_t timestamp_ms = 0;
    ErrorKind kind = ErrorKind::Protocol;
    Severity severity = Severity::Medium;
    std::string message;
    bool retryable = true;
    ErrorContext context;
};

} // namespace error
