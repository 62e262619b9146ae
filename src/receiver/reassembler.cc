#include "receiver/reassembler.h"
#include "core/timer/spawn_after_delay.h"
#include "progress/transfer_timeout.h"
#include "protocol/messages.h"
#include "util/hash.h"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace receiver {

namespace {
bool known_kind(std::uint32_t kind) {
    return kind >= static_cast<std::uint32_t>(error::ErrorKind::Validation)
           && kind <= static_cast<std::uint32_t>(error::ErrorKind::Permission);
}
} // namespace

const char* to_string(Phase phase) {
    switch (phase) {
    case Phase::Initializing:
        return "initializing";
    case Phase::Receiving:
        return "receiving";
    case Phase::Finalizing:
        return "finalizing";
    case Phase::Complete:
        return "complete";
    case Phase::Failed:
        return "failed";
    }
    return "unknown";
}

Reassembler::Reassembler(ReceiverContext context, ReplyFn reply)
    : ctx_(context)
    , reply_(std::move(reply))
    , alive_(std::make_shared<bool>(true)) {}

Reassembler::~Reassembler() {
    alive_.reset();
}

StorageCapabilities Reassembler::capabilities() const {
    return StorageCapabilities{ctx_.settings.streaming_available, ctx_.settings.streaming_threshold};
}

Reassembler::IncomingTransfer* Reassembler::find(const std::string& transfer_id) {
    const auto it = transfers_.find(transfer_id);
    return it == transfers_.end() ? nullptr : it->second.get();
}

const Reassembler::IncomingTransfer* Reassembler::find(const std::string& transfer_id) const {
    const auto it = transfers_.find(transfer_id);
    return it == transfers_.end() ? nullptr : it->second.get();
}

Reassembler::IncomingTransfer* Reassembler::find(const std::string& transfer_id,
                                                 std::uint64_t generation) {
    auto* transfer = find(transfer_id);
    return transfer != nullptr && transfer->generation == generation ? transfer : nullptr;
}

Reassembler::IncomingTransfer& Reassembler::create_pending(const std::string& peer_id,
                                                           const std::string& transfer_id) {
    auto transfer = std::make_unique<IncomingTransfer>();
    transfer->transfer_id = transfer_id;
    transfer->peer_id = peer_id;
    transfer->generation = next_generation_++;
    transfer->created_at = std::chrono::steady_clock::now();
    auto& ref = *transfer;
    transfers_[transfer_id] = std::move(transfer);
    return ref;
}

void Reassembler::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    ctx_.executor.spawn(core::timer::spawn_after_delay(
        [alive = std::weak_ptr<bool>(alive_), fn = std::move(fn)]() {
            if (!alive.expired()) {
                fn();
            }
        },
        delay));
}

void Reassembler::handle_frame(const std::string& peer_id, const protocol::Frame& frame) {
    using protocol::MessageType;

    if (frame.is(MessageType::Start)) {
        const auto start = protocol::parse_body<wire::FileStart>(frame);
        if (!start) {
            spdlog::warn("[Reassembler::handle_frame] Malformed START for {}", frame.transfer_id);
            return;
        }
        on_file_start(peer_id, frame.transfer_id, *start);
    } else if (frame.is(MessageType::Data)) {
        on_chunk(peer_id, frame.transfer_id, ConstDataBlock(frame.payload.data(), frame.payload.size()));
    } else if (frame.is(MessageType::End)) {
        const auto end = protocol::parse_body<wire::FileEnd>(frame);
        if (!end) {
            spdlog::warn("[Reassembler::handle_frame] Malformed END for {}", frame.transfer_id);
            return;
        }
        on_file_end(peer_id, frame.transfer_id, *end);
    } else if (frame.is(MessageType::Error)) {
        const auto err = protocol::parse_body<wire::FileError>(frame);
        if (!err) {
            spdlog::warn("[Reassembler::handle_frame] Malformed ERROR for {}", frame.transfer_id);
            return;
        }
        on_remote_error(frame.transfer_id, *err);
    } else {
        spdlog::warn("[Reassembler::handle_frame] Unexpected message type {} from {}",
                     frame.type,
                     peer_id);
    }
}

void Reassembler::on_file_start(const std::string& peer_id,
                                const std::string& transfer_id,
                                const wire::FileStart& start) {
    if (start.file_size() == 0 || start.file_name().empty()) {
        const std::string message = "START carries no file name or an empty file";
        error::ErrorContext context;
        context.file_name = start.file_name();
        context.file_size = start.file_size();
        ctx_.errors.create_error(transfer_id, error::ErrorKind::Validation, message, context);
        send_error(peer_id, transfer_id, error::ErrorKind::Validation, message);
        transfers_.erase(transfer_id);
        return;
    }

    auto* transfer = find(transfer_id);
    if (transfer != nullptr && transfer->start_received) {
        if (transfer->phase == Phase::Failed && transfer->storage) {
            // Same transfer sent again: keep what already arrived.
            spdlog::info("[Reassembler::on_file_start] {} restarted by {}, keeping {} chunks",
                         transfer_id,
                         peer_id,
                         transfer->received.size());
            if (ctx_.persistence != nullptr
                && !ctx_.persistence->record_resume_attempt(transfer_id)) {
                spdlog::debug("[Reassembler::on_file_start] No persisted record for {}", transfer_id);
            }
            transfer->peer_id = peer_id;
            transfer->phase = Phase::Receiving;
            transfer->total_final = false;
            transfer->finalize_rounds = 0;
            transfer->resumed = true;
            transfer->last_progress = std::chrono::steady_clock::now();
            ctx_.progress.start(transfer_id, transfer->file_name, transfer->file_size);
            ctx_.progress.update(transfer_id, transfer->bytes_received);
            ctx_.errors.start_transfer(transfer_id);
            arm_watchdog(*transfer);
            return;
        }
        spdlog::warn("[Reassembler::on_file_start] Duplicate START for {} ({}), ignored",
                     transfer_id,
                     to_string(transfer->phase));
        return;
    }

    if (transfer == nullptr) {
        transfer = &create_pending(peer_id, transfer_id);
    }
    transfer->peer_id = peer_id;
    transfer->start_received = true;
    transfer->file_name = start.file_name();
    transfer->file_size = start.file_size();
    transfer->file_hash = start.file_hash();
    transfer->chunk_size = start.chunk_size();
    transfer->total_chunks = std::min<std::uint64_t>(start.total_chunks_estimate(), start.file_size());
    transfer->start_time = std::chrono::steady_clock::now();

    spdlog::info("[Reassembler::on_file_start] {} ({} bytes) from {}, id {}",
                 transfer->file_name,
                 transfer->file_size,
                 peer_id,
                 transfer_id);

    auto choice = select_storage(transfer->file_size, capabilities());
    if (choice == StorageChoice::ConfirmMemory) {
        if (confirm_) {
            // Frames keep queueing while the user decides.
            ctx_.executor.spawn(confirm_memory(alive_,
                                               transfer_id,
                                               transfer->generation,
                                               transfer->file_name,
                                               transfer->file_size));
            return;
        }
        spdlog::warn("[Reassembler::on_file_start] No streaming sink, buffering {} bytes in memory",
                     transfer->file_size);
        choice = StorageChoice::Memory;
    }
    begin(*transfer, choice);
}

asio::awaitable<void> Reassembler::confirm_memory(std::weak_ptr<bool> alive,
                                                  std::string transfer_id,
                                                  std::uint64_t generation,
                                                  std::string file_name,
                                                  std::uint64_t file_size) {
    if (alive.expired()) {
        co_return;
    }
    const bool accepted = co_await confirm_(file_name, file_size);
    if (alive.expired()) {
        co_return;
    }

    auto* transfer = find(transfer_id, generation);
    if (transfer == nullptr || transfer->phase != Phase::Initializing) {
        co_return;
    }
    if (!accepted) {
        spdlog::info("[Reassembler::confirm_memory] User declined {} ({} bytes)", file_name, file_size);
        abandon(transfer_id, "Receiver declined the transfer", true);
        co_return;
    }
    begin(*transfer, StorageChoice::Memory);
}

bool Reassembler::open_storage(IncomingTransfer& transfer,
                               persistence::StorageMethod method,
                               std::optional<persistence::TransferState>& resumed) {
    const FileInfo info{transfer.transfer_id, transfer.file_name, transfer.file_size, transfer.file_hash};

    if (method == persistence::StorageMethod::Memory) {
        // Buffered chunks do not outlive the process.
        resumed.reset();
        transfer.storage = std::make_unique<MemoryChunkStorage>(info);
        transfer.destination.clear();
        return true;
    }

    std::error_code ec;
    const bool reuse = resumed && resumed->storage_method == persistence::StorageMethod::Streaming
                       && !resumed->destination_path.empty()
                       && std::filesystem::exists(resumed->destination_path, ec);
    if (!reuse) {
        resumed.reset();
    }

    const auto destination = reuse ? std::filesystem::path(resumed->destination_path)
                                   : unique_destination(ctx_.settings.save_dir, transfer.file_name);
    auto storage = std::make_unique<StreamingChunkStorage>(info, destination);
    const bool opened = reuse ? storage->open(&resumed->received_chunks, resumed->bytes_received)
                              : storage->open();
    if (!opened) {
        return false;
    }
    transfer.storage = std::move(storage);
    transfer.destination = destination;
    return true;
}

void Reassembler::begin(IncomingTransfer& transfer, StorageChoice choice) {
    const auto& id = transfer.transfer_id;

    std::optional<persistence::TransferState> resumed;
    if (ctx_.persistence != nullptr && ctx_.persistence->can_resume_transfer(id)) {
        resumed = ctx_.persistence->load_transfer_state(id);
        if (resumed
            && (resumed->file_size != transfer.file_size || resumed->file_hash != transfer.file_hash)) {
            spdlog::warn("[Reassembler::begin] Persisted record for {} describes another file", id);
            resumed.reset();
        }
    }

    const auto method = choice == StorageChoice::Streaming ? persistence::StorageMethod::Streaming
                                                           : persistence::StorageMethod::Memory;
    if (!open_storage(transfer, method, resumed)) {
        fail(transfer, error::ErrorKind::Storage, "Cannot prepare storage for " + transfer.file_name, true, false);
        return;
    }

    if (resumed) {
        if (!ctx_.persistence->record_resume_attempt(id)) {
            spdlog::warn("[Reassembler::begin] Could not record resume attempt for {}", id);
        }
        transfer.received = resumed->received_chunks;
        transfer.bytes_received = resumed->bytes_received;
        transfer.resumed = true;
        spdlog::info("[Reassembler::begin] Resuming {} with {} of {} chunks",
                     id,
                     transfer.received.size(),
                     resumed->total_chunks);
    } else if (ctx_.persistence != nullptr) {
        persistence::NewTransfer record;
        record.transfer_id = id;
        record.file_name = transfer.file_name;
        record.file_size = transfer.file_size;
        record.file_hash = transfer.file_hash;
        record.total_chunks = transfer.total_chunks;
        record.chunk_size = transfer.chunk_size;
        record.storage_method = method;
        record.destination_path = transfer.destination.string();
        ctx_.persistence->create_transfer_state(record);
    }

    transfer.phase = Phase::Receiving;
    transfer.last_progress = std::chrono::steady_clock::now();
    ctx_.progress.start(id, transfer.file_name, transfer.file_size);
    if (transfer.bytes_received > 0) {
        ctx_.progress.update(id, transfer.bytes_received);
    }
    ctx_.errors.start_transfer(id);
    arm_watchdog(transfer);

    spdlog::debug("[Reassembler::begin] {} stored in {}, {} queued frames",
                  id,
                  persistence::to_string(method),
                  transfer.queue.size());
    drain_queue(transfer);
}

void Reassembler::enqueue(IncomingTransfer& transfer, std::uint32_t type, ConstDataBlock payload) {
    transfer.queue.push_back(PendingFrame{type, ByteBuffer(payload.begin(), payload.end())});
    spdlog::debug("[Reassembler::enqueue] {} waiting for START, {} frames queued",
                  transfer.transfer_id,
                  transfer.queue.size());
}

void Reassembler::drain_queue(IncomingTransfer& transfer) {
    while (!transfer.queue.empty()
           && (transfer.phase == Phase::Receiving || transfer.phase == Phase::Finalizing)) {
        auto frame = std::move(transfer.queue.front());
        transfer.queue.pop_front();

        const ConstDataBlock payload(frame.payload.data(), frame.payload.size());
        if (frame.type == static_cast<std::uint32_t>(protocol::MessageType::Data)) {
            accept_chunk(transfer, payload);
        } else if (frame.type == static_cast<std::uint32_t>(protocol::MessageType::End)) {
            const auto end = util::deserialize<wire::FileEnd>(payload);
            if (!end) {
                spdlog::warn("[Reassembler::drain_queue] Dropping malformed queued END for {}",
                             transfer.transfer_id);
                continue;
            }
            accept_end(transfer, *end);
        }
    }
}

void Reassembler::check_pending_start(const std::string& transfer_id, std::uint64_t generation) {
    const auto* transfer = find(transfer_id, generation);
    if (transfer == nullptr || transfer->start_received) {
        return;
    }

    const auto message = fmt::format("No START within {} ms, dropping {} queued frames",
                                      ctx_.settings.pending_start_timeout_ms,
                                      transfer->queue.size());
    ctx_.errors.create_error(transfer_id, error::ErrorKind::Protocol, message);
    send_error(transfer->peer_id, transfer_id, error::ErrorKind::Protocol, message);
    transfers_.erase(transfer_id);
}

void Reassembler::on_chunk(const std::string& peer_id,
                           const std::string& transfer_id,
                           ConstDataBlock payload) {
    auto* transfer = find(transfer_id);
    if (transfer == nullptr) {
        const auto view = protocol::unpack_chunk(payload);
        if (!view) {
            spdlog::warn("[Reassembler::on_chunk] Malformed chunk for unknown transfer {}", transfer_id);
            return;
        }
        if (view->header.chunk_index() != 0) {
            spdlog::warn("[Reassembler::on_chunk] Chunk {} for unknown transfer {} dropped",
                         view->header.chunk_index(),
                         transfer_id);
            return;
        }
        auto& pending = create_pending(peer_id, transfer_id);
        enqueue(pending, static_cast<std::uint32_t>(protocol::MessageType::Data), payload);
        schedule(std::chrono::milliseconds(ctx_.settings.pending_start_timeout_ms),
                 [this, transfer_id, generation = pending.generation]() {
                     check_pending_start(transfer_id, generation);
                 });
        return;
    }

    switch (transfer->phase) {
    case Phase::Initializing:
        enqueue(*transfer, static_cast<std::uint32_t>(protocol::MessageType::Data), payload);
        break;
    case Phase::Receiving:
    case Phase::Finalizing:
        accept_chunk(*transfer, payload);
        break;
    case Phase::Complete:
    case Phase::Failed:
        spdlog::debug("[Reassembler::on_chunk] {} is {}, late chunk ignored",
                      transfer_id,
                      to_string(transfer->phase));
        break;
    }
}

void Reassembler::accept_chunk(IncomingTransfer& transfer, ConstDataBlock payload) {
    const auto& id = transfer.transfer_id;
    const auto view = protocol::unpack_chunk(payload);
    if (!view) {
        ctx_.errors.create_error(id, error::ErrorKind::Protocol, "Malformed chunk payload", context_of(transfer));
        return;
    }

    const auto& header = view->header;
    const auto index = header.chunk_index();
    const auto data = view->data;

    // Every chunk carries at least one byte, so no valid index reaches file_size.
    if (index >= transfer.file_size || (transfer.total_final && index >= transfer.total_chunks)) {
        auto context = context_of(transfer);
        context.chunk_index = index;
        context.data_size = data.size();
        ctx_.errors.create_error(id, error::ErrorKind::Validation, "Chunk index out of range", context);
        ctx_.errors.update_metrics(id, {.chunks_failed = 1});
        return;
    }
    if (data.empty() || header.offset() + data.size() > transfer.file_size) {
        reject_chunk(transfer, index, error::ErrorKind::Validation, "Chunk lies outside the file", data.size());
        return;
    }
    if (transfer.received.contains(index)) {
        spdlog::debug("[Reassembler::accept_chunk] Duplicate chunk {} of {}", index, id);
        return;
    }

    bool verified = false;
    if (!header.chunk_hash().empty()) {
        const auto digest = util::hash::sha256_hex(data);
        if (!digest || *digest != header.chunk_hash()) {
            ctx_.errors.update_metrics(id, {.integrity_checks_failed = 1});
            reject_chunk(transfer, index, error::ErrorKind::Integrity, "Chunk hash mismatch", data.size());
            return;
        }
        verified = true;
    }

    if (!transfer.storage->write_chunk(index, header.offset(), data)) {
        reject_chunk(transfer, index, error::ErrorKind::Storage, "Failed to store chunk", data.size());
        return;
    }

    transfer.received.insert(index);
    transfer.bytes_received += data.size();
    transfer.last_progress = std::chrono::steady_clock::now();
    ctx_.retries.remove(id, index);
    const auto estimate = std::min<std::uint64_t>(header.total_chunks_estimate(), transfer.file_size);
    if (!transfer.total_final && estimate > transfer.total_chunks) {
        transfer.total_chunks = estimate;
    }

    if (ctx_.persistence != nullptr) {
        ctx_.persistence->mark_chunk_received(id, index, data.size(), verified, header.chunk_hash());
    }
    ctx_.progress.update(id, transfer.bytes_received);
    ctx_.errors.update_metrics(id,
                               {.bytes_transferred = transfer.bytes_received,
                                .chunks_transferred = 1,
                                .integrity_checks_passed = verified ? 1u : 0u});
    maybe_ack(transfer);
}

void Reassembler::reject_chunk(IncomingTransfer& transfer,
                               std::uint64_t chunk_index,
                               error::ErrorKind kind,
                               const std::string& message,
                               std::uint64_t data_size) {
    const auto& id = transfer.transfer_id;
    auto context = context_of(transfer);
    context.chunk_index = chunk_index;
    context.data_size = data_size;
    ctx_.errors.create_error(id, kind, message, context);
    ctx_.errors.update_metrics(id, {.chunks_failed = 1});

    const int attempts = ctx_.retries.add(id, chunk_index);
    if (attempts > ctx_.retries.max_retries()) {
        fail(transfer,
             kind,
             fmt::format("Chunk {} rejected {} times: {}", chunk_index, attempts, message),
             true,
             false);
        return;
    }
    send_resend(transfer, {chunk_index});
}

void Reassembler::on_file_end(const std::string& peer_id,
                              const std::string& transfer_id,
                              const wire::FileEnd& end) {
    auto* transfer = find(transfer_id);
    if (transfer == nullptr) {
        auto& pending = create_pending(peer_id, transfer_id);
        transfer = &pending;
        schedule(std::chrono::milliseconds(ctx_.settings.pending_start_timeout_ms),
                 [this, transfer_id, generation = pending.generation]() {
                     check_pending_start(transfer_id, generation);
                 });
    }

    switch (transfer->phase) {
    case Phase::Initializing: {
        const auto body = util::serialize(end);
        if (!body) {
            spdlog::error("[Reassembler::on_file_end] Failed to queue END for {}", transfer_id);
            return;
        }
        enqueue(*transfer,
                static_cast<std::uint32_t>(protocol::MessageType::End),
                ConstDataBlock(body->data(), body->size()));
        break;
    }
    case Phase::Receiving:
    case Phase::Finalizing:
        accept_end(*transfer, end);
        break;
    case Phase::Complete:
    case Phase::Failed:
        spdlog::debug("[Reassembler::on_file_end] {} is {}, END ignored",
                      transfer_id,
                      to_string(transfer->phase));
        break;
    }
}

void Reassembler::accept_end(IncomingTransfer& transfer, const wire::FileEnd& end) {
    const auto& id = transfer.transfer_id;
    if (end.total_chunks() == 0 || end.total_chunks() > transfer.file_size
        || end.total_bytes() != transfer.file_size) {
        fail(transfer,
             error::ErrorKind::Protocol,
             fmt::format("END reports {} bytes in {} chunks for a {} byte file",
                         end.total_bytes(),
                         end.total_chunks(),
                         transfer.file_size),
             true,
             false);
        return;
    }

    transfer.total_chunks = end.total_chunks();
    transfer.total_final = true;
    transfer.phase = Phase::Finalizing;
    if (ctx_.persistence != nullptr) {
        ctx_.persistence->update_total_chunks(id, transfer.total_chunks);
    }

    spdlog::debug("[Reassembler::accept_end] {} has {} chunks, {} received",
                  id,
                  transfer.total_chunks,
                  transfer.received.size());

    // In-flight chunks get a grace period before the missing set is taken.
    if (!transfer.finalize_scheduled) {
        transfer.finalize_scheduled = true;
        schedule(std::chrono::milliseconds(ctx_.settings.finalize_grace_ms),
                 [this, id, generation = transfer.generation]() { run_finalize(id, generation); });
    }
}

void Reassembler::run_finalize(const std::string& transfer_id, std::uint64_t generation) {
    auto* transfer = find(transfer_id, generation);
    if (transfer == nullptr || transfer->phase != Phase::Finalizing) {
        return;
    }
    transfer->finalize_scheduled = false;
    finalize(transfer_id);
}

FinalizeOutcome Reassembler::finalize(const std::string& transfer_id) {
    FinalizeOutcome outcome;
    auto* transfer = find(transfer_id);
    if (transfer == nullptr) {
        spdlog::warn("[Reassembler::finalize] Unknown transfer {}", transfer_id);
        return outcome;
    }
    if (transfer->phase == Phase::Complete) {
        outcome.completed = true;
        return outcome;
    }
    if (!transfer->total_final
        || (transfer->phase != Phase::Finalizing && transfer->phase != Phase::Receiving)) {
        spdlog::debug("[Reassembler::finalize] {} is {} without a final chunk count",
                      transfer_id,
                      to_string(transfer->phase));
        return outcome;
    }
    transfer->phase = Phase::Finalizing;

    for (std::uint64_t i = 0; i < transfer->total_chunks; ++i) {
        if (!transfer->received.contains(i)) {
            outcome.missing.push_back(i);
        }
    }

    if (!outcome.missing.empty()) {
        ++transfer->finalize_rounds;
        if (transfer->finalize_rounds > ctx_.settings.max_finalize_rounds) {
            outcome.error = fail(*transfer,
                                 error::ErrorKind::Protocol,
                                 fmt::format("{} chunks still missing after {} resend rounds",
                                             outcome.missing.size(),
                                             ctx_.settings.max_finalize_rounds),
                                 true,
                                 false);
            return outcome;
        }
        spdlog::warn("[Reassembler::finalize] {} missing {} chunks, requesting resend ({}/{})",
                     transfer_id,
                     outcome.missing.size(),
                     transfer->finalize_rounds,
                     ctx_.settings.max_finalize_rounds);
        send_resend(*transfer, outcome.missing);
        return outcome;
    }

    auto result = transfer->storage->finalize(transfer->total_chunks);
    switch (result.status) {
    case FinalizeStatus::Ok:
        break;
    case FinalizeStatus::HashMismatch:
    case FinalizeStatus::SizeMismatch:
        outcome.error = fail(*transfer,
                             error::ErrorKind::Integrity,
                             fmt::format("{}: {}", transfer->file_name, result.message),
                             true,
                             false);
        return outcome;
    case FinalizeStatus::StorageFailure:
        outcome.error = fail(*transfer,
                             error::ErrorKind::Storage,
                             fmt::format("{}: {}", transfer->file_name, result.message),
                             true,
                             false);
        return outcome;
    }

    auto artifact = std::move(*result.artifact);
    if (artifact.method == persistence::StorageMethod::Streaming
        && ctx_.settings.verify_streamed_files && !transfer->file_hash.empty()) {
        ctx_.executor.spawn(verify_streamed(alive_, transfer_id, transfer->generation, std::move(artifact)));
        return outcome;
    }

    complete(*transfer, std::move(artifact));
    outcome.completed = true;
    return outcome;
}

asio::awaitable<void> Reassembler::verify_streamed(std::weak_ptr<bool> alive,
                                                   std::string transfer_id,
                                                   std::uint64_t generation,
                                                   ReceivedArtifact artifact) {
    if (alive.expired()) {
        co_return;
    }
    const auto digest = co_await ctx_.executor.offload(
        [path = artifact.path]() { return util::hash::sha256_file_hex(path); });
    if (alive.expired()) {
        co_return;
    }

    auto* transfer = find(transfer_id, generation);
    if (transfer == nullptr || transfer->phase != Phase::Finalizing) {
        co_return;
    }
    if (!digest || *digest != transfer->file_hash) {
        fail(*transfer,
             error::ErrorKind::Integrity,
             fmt::format("{}: file hash mismatch on disk", transfer->file_name),
             true,
             false);
        co_return;
    }
    artifact.hash_verified = true;
    complete(*transfer, std::move(artifact));
}

void Reassembler::complete(IncomingTransfer& transfer, ReceivedArtifact artifact) {
    const auto id = transfer.transfer_id;
    const auto generation = transfer.generation;
    transfer.phase = Phase::Complete;
    transfer.storage.reset();
    transfer.queue.clear();
    maybe_ack(transfer);

    spdlog::info("[Reassembler::complete] Received {} ({} bytes, {} chunks{})",
                 transfer.file_name,
                 transfer.file_size,
                 transfer.total_chunks,
                 artifact.hash_verified ? ", hash verified" : "");

    schedule(std::chrono::milliseconds(ctx_.settings.pending_max_age_ms), [this, id, generation]() {
        const auto* done = find(id, generation);
        if (done != nullptr && done->phase == Phase::Complete) {
            transfers_.erase(id);
        }
    });

    ctx_.errors.complete_transfer(id, error::FinalStatus::Completed);
    ctx_.retries.clear(id);
    if (ctx_.persistence != nullptr && !ctx_.persistence->remove_transfer_state(id)) {
        spdlog::warn("[Reassembler::complete] Persisted record for {} not fully removed", id);
    }
    ctx_.progress.complete(id);

    // transfer may be gone once the callback returns.
    if (received_) {
        received_(artifact);
    }
}

error::StructuredError Reassembler::fail(IncomingTransfer& transfer,
                                         error::ErrorKind kind,
                                         const std::string& message,
                                         bool notify_sender,
                                         bool keep_for_resume) {
    const auto id = transfer.transfer_id;
    auto err = ctx_.errors.create_error(id, kind, message, context_of(transfer));
    if (notify_sender) {
        send_error(transfer.peer_id, id, kind, message);
    }

    transfer.phase = Phase::Failed;
    transfer.queue.clear();
    transfer.finalize_scheduled = false;
    if (!keep_for_resume && transfer.storage) {
        transfer.storage->abort(true);
        transfer.storage.reset();
    }

    // The record stays so the transfer can be resumed later.
    if (ctx_.persistence != nullptr && !ctx_.persistence->flush(id)) {
        spdlog::debug("[Reassembler::fail] Nothing persisted for {}", id);
    }
    ctx_.errors.complete_transfer(id, error::FinalStatus::Failed, err);
    ctx_.retries.clear(id);
    ctx_.progress.fail(id, message);
    return err;
}

void Reassembler::abandon(const std::string& transfer_id, const std::string& reason, bool notify_sender) {
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    auto& transfer = *it->second;

    ctx_.errors.create_error(transfer_id, error::ErrorKind::UserCancelled, reason, context_of(transfer));
    if (notify_sender) {
        send_error(transfer.peer_id, transfer_id, error::ErrorKind::UserCancelled, reason);
    }
    if (transfer.storage) {
        transfer.storage->abort(true);
    }
    ctx_.errors.complete_transfer(transfer_id, error::FinalStatus::Cancelled);
    ctx_.retries.clear(transfer_id);
    if (ctx_.persistence != nullptr && !ctx_.persistence->remove_transfer_state(transfer_id)) {
        spdlog::warn("[Reassembler::abandon] Persisted record for {} not fully removed", transfer_id);
    }
    // transfer_id may refer into the erased entry.
    const auto id = transfer_id;
    transfers_.erase(it);
    ctx_.progress.cancel(id);
}

bool Reassembler::cancel(const std::string& transfer_id) {
    const auto* transfer = find(transfer_id);
    if (transfer == nullptr || transfer->phase == Phase::Complete) {
        return false;
    }
    spdlog::info("[Reassembler::cancel] Cancelling {}", transfer_id);
    abandon(transfer_id, "Transfer cancelled by receiver", true);
    return true;
}

void Reassembler::on_remote_error(const std::string& transfer_id, const wire::FileError& error) {
    auto* transfer = find(transfer_id);
    if (transfer == nullptr) {
        spdlog::warn("[Reassembler::on_remote_error] Error for unknown transfer {}: {}",
                     transfer_id,
                     error.message());
        return;
    }
    if (transfer->phase == Phase::Complete || transfer->phase == Phase::Failed) {
        spdlog::debug("[Reassembler::on_remote_error] {} already {}: {}",
                      transfer_id,
                      to_string(transfer->phase),
                      error.message());
        return;
    }

    const auto kind = known_kind(error.kind()) ? static_cast<error::ErrorKind>(error.kind())
                                               : error::ErrorKind::Protocol;
    if (kind == error::ErrorKind::UserCancelled) {
        spdlog::info("[Reassembler::on_remote_error] Sender cancelled {}", transfer_id);
        abandon(transfer_id, error.message(), false);
        return;
    }
    fail(*transfer, kind, "Sender reported: " + error.message(), false, true);
}

bool Reassembler::resume(const std::string& transfer_id, const std::string& peer_id) {
    auto* transfer = find(transfer_id);

    if (transfer != nullptr) {
        if (!transfer->start_received || transfer->phase == Phase::Initializing
            || transfer->phase == Phase::Complete) {
            return false;
        }
        if (!transfer->storage) {
            spdlog::warn("[Reassembler::resume] Storage of {} was released", transfer_id);
            return false;
        }
        if (ctx_.persistence != nullptr) {
            const auto state = ctx_.persistence->load_transfer_state(transfer_id);
            if (state && state->resume_attempts >= ctx_.persistence->settings().max_resume_attempts) {
                spdlog::warn("[Reassembler::resume] {} used all {} resume attempts",
                             transfer_id,
                             state->resume_attempts);
                return false;
            }
            if (state && !ctx_.persistence->record_resume_attempt(transfer_id)) {
                spdlog::warn("[Reassembler::resume] Could not record resume attempt for {}", transfer_id);
            }
        }
        if (!peer_id.empty()) {
            transfer->peer_id = peer_id;
        }
    } else {
        if (ctx_.persistence == nullptr || !ctx_.persistence->can_resume_transfer(transfer_id)) {
            return false;
        }
        auto state = ctx_.persistence->load_transfer_state(transfer_id);
        if (!state || state->storage_method != persistence::StorageMethod::Streaming) {
            spdlog::info("[Reassembler::resume] {} was buffered in memory and cannot be resumed",
                         transfer_id);
            return false;
        }
        if (peer_id.empty()) {
            spdlog::warn("[Reassembler::resume] No peer to resume {} from", transfer_id);
            return false;
        }

        auto& rebuilt = create_pending(peer_id, transfer_id);
        rebuilt.start_received = true;
        rebuilt.file_name = state->file_name;
        rebuilt.file_size = state->file_size;
        rebuilt.file_hash = state->file_hash;
        rebuilt.chunk_size = state->chunk_size;
        rebuilt.total_chunks = state->total_chunks;
        rebuilt.start_time = std::chrono::steady_clock::now();

        std::optional<persistence::TransferState> resumed = state;
        if (!open_storage(rebuilt, persistence::StorageMethod::Streaming, resumed) || !resumed) {
            spdlog::warn("[Reassembler::resume] Partial file of {} is gone", transfer_id);
            if (rebuilt.storage) {
                rebuilt.storage->abort(false);
            }
            transfers_.erase(transfer_id);
            return false;
        }
        if (!ctx_.persistence->record_resume_attempt(transfer_id)) {
            spdlog::warn("[Reassembler::resume] Could not record resume attempt for {}", transfer_id);
        }
        rebuilt.received = resumed->received_chunks;
        rebuilt.bytes_received = resumed->bytes_received;
        transfer = &rebuilt;
    }

    transfer->phase = Phase::Receiving;
    transfer->finalize_rounds = 0;
    transfer->resumed = true;
    transfer->last_progress = std::chrono::steady_clock::now();
    ctx_.progress.start(transfer_id, transfer->file_name, transfer->file_size);
    ctx_.progress.update(transfer_id, transfer->bytes_received);
    ctx_.errors.start_transfer(transfer_id);
    arm_watchdog(*transfer);

    std::vector<std::uint64_t> missing;
    for (std::uint64_t i = 0; i < transfer->total_chunks; ++i) {
        if (!transfer->received.contains(i)) {
            missing.push_back(i);
        }
    }
    spdlog::info("[Reassembler::resume] Resuming {}: {} of {} chunks missing",
                 transfer_id,
                 missing.size(),
                 transfer->total_chunks);
    // An empty request still makes the sender repeat END.
    send_resend(*transfer, missing);
    return true;
}

void Reassembler::on_peer_lost(const std::string& peer_id) {
    std::vector<std::string> orphaned;
    for (auto& [id, transfer] : transfers_) {
        if (transfer->peer_id != peer_id) {
            continue;
        }
        if (!transfer->start_received) {
            orphaned.push_back(id);
            continue;
        }
        if (transfer->phase == Phase::Receiving || transfer->phase == Phase::Finalizing
            || transfer->phase == Phase::Initializing) {
            fail(*transfer, error::ErrorKind::Network, "Peer " + peer_id + " disconnected", false, true);
        }
    }
    for (const auto& id : orphaned) {
        transfers_.erase(id);
    }
}

void Reassembler::arm_watchdog(IncomingTransfer& transfer) {
    if (transfer.watchdog_running) {
        return;
    }
    transfer.watchdog_running = true;
    schedule(std::chrono::milliseconds(ctx_.settings.stall_timeout_ms),
             [this, id = transfer.transfer_id, generation = transfer.generation]() {
                 check_stall(id, generation);
             });
}

void Reassembler::check_stall(const std::string& transfer_id, std::uint64_t generation) {
    auto* transfer = find(transfer_id, generation);
    if (transfer == nullptr) {
        return;
    }
    if (transfer->phase != Phase::Receiving && transfer->phase != Phase::Finalizing) {
        transfer->watchdog_running = false;
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto timeout = progress::adaptive_timeout(
        transfer->file_size,
        transfer->bytes_received,
        std::chrono::duration_cast<std::chrono::milliseconds>(now - transfer->start_time),
        std::chrono::milliseconds(ctx_.settings.stall_timeout_ms));
    const auto deadline = transfer->last_progress + timeout;

    if (now >= deadline) {
        transfer->watchdog_running = false;
        fail(*transfer,
             error::ErrorKind::Timeout,
             fmt::format("No progress for {} ms", timeout.count()),
             true,
             true);
        return;
    }
    schedule(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                 + std::chrono::milliseconds(1),
             [this, transfer_id, generation]() { check_stall(transfer_id, generation); });
}

void Reassembler::maybe_ack(IncomingTransfer& transfer) {
    const auto now = std::chrono::steady_clock::now();
    const progress::AckTransferInfo info{transfer.file_size,
                                         transfer.bytes_received,
                                         transfer.start_time,
                                         transfer.last_acked_percentage,
                                         transfer.last_ack_time};
    const auto decision = ctx_.acks.decide(info, now);
    if (!decision.send) {
        return;
    }

    wire::FileAck ack;
    ack.set_progress_percent(static_cast<std::uint32_t>(decision.percentage));
    ack.set_bytes_received(transfer.bytes_received);
    const auto frame = protocol::make_frame(protocol::MessageType::Ack, transfer.transfer_id, ack);
    if (!frame || !reply_ || !reply_(transfer.peer_id, ConstDataBlock(frame->data(), frame->size()))) {
        spdlog::debug("[Reassembler::maybe_ack] ACK for {} not sent", transfer.transfer_id);
        return;
    }
    transfer.last_acked_percentage = decision.percentage;
    transfer.last_ack_time = now;
}

void Reassembler::send_resend(const IncomingTransfer& transfer,
                              const std::vector<std::uint64_t>& indices) {
    wire::ResendRequest request;
    for (const auto index : indices) {
        request.add_chunk_indices(index);
    }
    const auto frame = protocol::make_frame(protocol::MessageType::Resend, transfer.transfer_id, request);
    if (!frame || !reply_ || !reply_(transfer.peer_id, ConstDataBlock(frame->data(), frame->size()))) {
        spdlog::warn("[Reassembler::send_resend] Could not request {} chunks of {}",
                     indices.size(),
                     transfer.transfer_id);
    }
}

void Reassembler::send_error(const std::string& peer_id,
                             const std::string& transfer_id,
                             error::ErrorKind kind,
                             const std::string& message) {
    wire::FileError body;
    body.set_message(message);
    body.set_kind(static_cast<std::uint32_t>(kind));
    const auto frame = protocol::make_frame(protocol::MessageType::Error, transfer_id, body);
    if (!frame || !reply_ || !reply_(peer_id, ConstDataBlock(frame->data(), frame->size()))) {
        spdlog::warn("[Reassembler::send_error] Could not tell {} about {}", peer_id, transfer_id);
    }
}

error::ErrorContext Reassembler::context_of(const IncomingTransfer& transfer) const {
    error::ErrorContext context;
    context.role = error::Role::Receiver;
    context.file_name = transfer.file_name;
    context.file_size = transfer.file_size;
    context.total_chunks = transfer.total_chunks;
    context.bytes_transferred = transfer.bytes_received;
    return context;
}

std::optional<IncomingSnapshot> Reassembler::snapshot(const std::string& transfer_id) const {
    const auto* transfer = find(transfer_id);
    if (transfer == nullptr) {
        return std::nullopt;
    }
    IncomingSnapshot s;
    s.transfer_id = transfer->transfer_id;
    s.peer_id = transfer->peer_id;
    s.file_name = transfer->file_name;
    s.file_size = transfer->file_size;
    s.total_chunks = transfer->total_chunks;
    s.bytes_received = transfer->bytes_received;
    s.chunks_received = transfer->received.size();
    s.queued_frames = transfer->queue.size();
    s.phase = transfer->phase;
    if (transfer->storage) {
        s.storage = transfer->storage->method();
    }
    s.finalize_rounds = transfer->finalize_rounds;
    return s;
}

std::vector<IncomingSnapshot> Reassembler::snapshots() const {
    std::vector<IncomingSnapshot> all;
    for (const auto& [id, transfer] : transfers_) {
        if (auto s = snapshot(id)) {
            all.push_back(std::move(*s));
        }
    }
    return all;
}

void Reassembler::clear_finished() {
    std::erase_if(transfers_, [](const auto& entry) {
        return entry.second->phase == Phase::Complete
               || (entry.second->phase == Phase::Failed && !entry.second->storage);
    });
}

} // namespace receiver
