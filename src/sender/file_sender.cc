#include "sender/file_sender.h"
#include "protocol/codec.h"
#include "protocol/messages.h"
#include "util/hash.h"
#include "util/time.h"
#include <algorithm>
#include <asio/post.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <limits>
#include <spdlog/spdlog.h>

namespace sender {

const char* to_string(SendStatus status) {
    switch (status) {
    case SendStatus::Pending:
        return "pending";
    case SendStatus::Sending:
        return "sending";
    case SendStatus::Sent:
        return "sent";
    case SendStatus::Failed:
        return "failed";
    case SendStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

FileSender::FileSender(SenderContext context,
                       std::vector<std::shared_ptr<core::Channel>> targets,
                       std::filesystem::path file_path,
                       std::string transfer_id)
    : ctx_(context)
    , targets_(std::move(targets))
    , file_path_(std::move(file_path))
    , transfer_id_(std::move(transfer_id))
    , file_name_(file_path_.filename().string()) {}

void FileSender::replace_target(std::shared_ptr<core::Channel> channel) {
    remove_target(channel->peer_id());
    ctx_.pacer.attach(*channel);
    targets_.push_back(std::move(channel));
}

bool FileSender::targets(const std::string& peer_id) const {
    return std::any_of(targets_.begin(), targets_.end(), [&](const auto& channel) {
        return channel->peer_id() == peer_id;
    });
}

void FileSender::remove_target(const std::string& peer_id) {
    std::erase_if(targets_, [&](const auto& channel) { return channel->peer_id() == peer_id; });
    if (targets_.empty() && status_ == SendStatus::Sending) {
        spdlog::warn("[FileSender::remove_target] Last target of {} went away", transfer_id_);
    }
}

std::size_t FileSender::channel_chunk_limit() const {
    std::size_t limit = std::numeric_limits<std::size_t>::max();
    for (const auto& channel : targets_) {
        limit = std::min(limit, channel->max_message_size());
    }
    const auto overhead = protocol::kDataFrameOverhead + transfer_id_.size();
    return limit > overhead ? limit - overhead : 0;
}

std::optional<ByteBuffer> FileSender::read_chunk(std::ifstream& in,
                                                 std::uint64_t offset,
                                                 std::size_t size) {
    ByteBuffer buffer(size);
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(in.gcount()) != size) {
        spdlog::error("[FileSender::read_chunk] Short read at offset {} of {}: {} of {} bytes",
                      offset,
                      file_path_.string(),
                      in.gcount(),
                      size);
        return std::nullopt;
    }
    return buffer;
}

// The frame size was checked against every target, so MessageTooLarge can
// only come from the first channel and nothing has been delivered yet.
void FileSender::send_to_targets(ConstDataBlock frame) {
    for (const auto& channel : targets_) {
        if (frame.size() > channel->max_message_size()) {
            throw core::ChannelError(core::ChannelError::Kind::MessageTooLarge,
                                     "frame of " + std::to_string(frame.size())
                                         + " bytes exceeds limit of " + channel->peer_id());
        }
    }
    for (const auto& channel : targets_) {
        channel->send(frame);
    }
}

void FileSender::send_start(const std::string& file_hash) {
    wire::FileStart start;
    start.set_file_name(file_name_);
    start.set_file_size(file_size_);
    start.set_file_hash(file_hash);
    const auto chunk_size = ctx_.planner.current_chunk_size();
    start.set_chunk_size(chunk_size);
    start.set_total_chunks_estimate((file_size_ + chunk_size - 1) / chunk_size);

    const auto frame = protocol::make_frame(protocol::MessageType::Start, transfer_id_, start);
    if (!frame) {
        throw std::runtime_error("failed to encode START");
    }
    send_to_targets(ConstDataBlock(frame->data(), frame->size()));
}

void FileSender::send_end() {
    wire::FileEnd end;
    end.set_total_chunks(chunks_.size());
    end.set_total_bytes(file_size_);
    end.set_transfer_time_ms(util::elapsed_ms(started_at_));

    const auto frame = protocol::make_frame(protocol::MessageType::End, transfer_id_, end);
    if (!frame) {
        throw std::runtime_error("failed to encode END");
    }
    send_to_targets(ConstDataBlock(frame->data(), frame->size()));
}

void FileSender::send_error(const error::StructuredError& err) {
    wire::FileError body;
    body.set_message(err.message);
    body.set_kind(static_cast<std::uint32_t>(err.kind));
    const auto frame = protocol::make_frame(protocol::MessageType::Error, transfer_id_, body);
    if (!frame) {
        spdlog::error("[FileSender::send_error] Failed to encode ERROR for {}", transfer_id_);
        return;
    }

    for (const auto& channel : targets_) {
        try {
            channel->send(ConstDataBlock(frame->data(), frame->size()));
        } catch (const core::ChannelError& e) {
            spdlog::warn("[FileSender::send_error] Could not notify {}: {}",
                         channel->peer_id(),
                         e.what());
        }
    }
}

asio::awaitable<void> FileSender::pace_targets() {
    // Targets may be removed while suspended.
    const auto targets = targets_;
    for (const auto& channel : targets) {
        ctx_.monitor.record_buffer_level(channel->buffered_amount());
        const auto result = co_await ctx_.pacer.wait_for_backpressure(*channel, &cancelled_);
        if (result == PaceResult::Cancelled) {
            co_return;
        }
    }
}

SendResult FileSender::fail(error::ErrorKind kind, const std::string& message) {
    error::ErrorContext context;
    context.role = error::Role::Sender;
    context.file_name = file_name_;
    context.file_size = file_size_;
    context.total_chunks = chunks_.size();
    context.bytes_transferred = bytes_sent_;

    auto err = ctx_.errors.create_error(transfer_id_, kind, message, context);
    // Receivers only know the transfer once START went out.
    if (announced_) {
        send_error(err);
    }

    status_ = SendStatus::Failed;
    // Failures before the first byte still show up in progress.
    if (!ctx_.progress.progress(transfer_id_)) {
        ctx_.progress.start(transfer_id_, file_name_, file_size_);
    }
    ctx_.progress.fail(transfer_id_, message);
    ctx_.progress.fail_ack(transfer_id_);
    ctx_.errors.complete_transfer(transfer_id_, error::FinalStatus::Failed, err);

    SendResult result;
    result.transfer_id = transfer_id_;
    result.status = SendStatus::Failed;
    result.total_chunks = chunks_.size();
    result.bytes_sent = bytes_sent_;
    result.error = std::move(err);
    return result;
}

SendResult FileSender::finish_cancelled() {
    if (remote_failure_) {
        return finish_remote_failure();
    }
    status_ = SendStatus::Cancelled;
    ctx_.progress.cancel(transfer_id_);
    ctx_.progress.fail_ack(transfer_id_);
    ctx_.errors.complete_transfer(transfer_id_, error::FinalStatus::Cancelled);
    spdlog::info("[FileSender::finish_cancelled] {} cancelled after {} chunks",
                 file_name_,
                 chunks_.size());
    return SendResult{transfer_id_, status_, chunks_.size(), bytes_sent_, std::nullopt};
}

SendResult FileSender::finish_remote_failure() {
    const bool declined = remote_failure_->kind == error::ErrorKind::UserCancelled;
    error::ErrorContext context;
    context.role = error::Role::Sender;
    context.file_name = file_name_;
    context.file_size = file_size_;
    context.bytes_transferred = bytes_sent_;
    auto err = ctx_.errors.create_error(transfer_id_, remote_failure_->kind, remote_failure_->message, context);

    status_ = declined ? SendStatus::Cancelled : SendStatus::Failed;
    if (declined) {
        ctx_.progress.cancel(transfer_id_);
    } else {
        ctx_.progress.fail(transfer_id_, remote_failure_->message);
    }
    ctx_.progress.fail_ack(transfer_id_);
    ctx_.errors.complete_transfer(transfer_id_,
                                  declined ? error::FinalStatus::Cancelled : error::FinalStatus::Failed,
                                  err);
    return SendResult{transfer_id_, status_, chunks_.size(), bytes_sent_, std::move(err)};
}

void FileSender::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    if (!announced_ || status_ == SendStatus::Failed || status_ == SendStatus::Cancelled) {
        return;
    }

    error::ErrorContext context;
    context.role = error::Role::Sender;
    context.file_name = file_name_;
    context.file_size = file_size_;
    context.bytes_transferred = bytes_sent_;
    const auto err = ctx_.errors.create_error(
        transfer_id_, error::ErrorKind::UserCancelled, "Transfer cancelled by sender", context);
    send_error(err);

    // A running pipeline reports the cancellation itself.
    if (status_ == SendStatus::Sent) {
        status_ = SendStatus::Cancelled;
        ctx_.progress.fail_ack(transfer_id_);
        ctx_.errors.complete_transfer(transfer_id_, error::FinalStatus::Cancelled, err);
    }
}

void FileSender::on_remote_error(const std::string& peer_id, const wire::FileError& error) {
    const auto kind = error.kind() >= static_cast<std::uint32_t>(error::ErrorKind::Validation)
                              && error.kind() <= static_cast<std::uint32_t>(error::ErrorKind::Permission)
                          ? static_cast<error::ErrorKind>(error.kind())
                          : error::ErrorKind::Protocol;
    spdlog::warn("[FileSender::on_remote_error] {} reported for {}: {}",
                 peer_id,
                 transfer_id_,
                 error.message());

    remove_target(peer_id);
    if (!targets_.empty()) {
        return;
    }

    if (status_ == SendStatus::Pending || status_ == SendStatus::Sending) {
        remote_failure_ = Failure{kind, "Receiver reported: " + error.message()};
        cancelled_ = true;
    } else if (status_ == SendStatus::Sent) {
        remote_failure_ = Failure{kind, "Receiver reported: " + error.message()};
        finish_remote_failure();
        remote_failure_.reset();
    }
}

asio::awaitable<SendResult> FileSender::send_file() {
    started_at_ = std::chrono::steady_clock::now();
    status_ = SendStatus::Sending;
    ctx_.errors.start_transfer(transfer_id_);

    if (targets_.empty()) {
        co_return fail(error::ErrorKind::Network, "No open channel to send on");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path_, ec)) {
        co_return fail(error::ErrorKind::Validation, "Not a readable file: " + file_path_.string());
    }
    file_size_ = std::filesystem::file_size(file_path_, ec);
    if (ec) {
        co_return fail(error::ErrorKind::Storage,
                       "Cannot stat " + file_path_.string() + ": " + ec.message());
    }
    if (file_size_ == 0) {
        co_return fail(error::ErrorKind::Validation, "Empty files cannot be transferred");
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in) {
        co_return fail(error::ErrorKind::Permission, "Cannot open " + file_path_.string());
    }

    ctx_.progress.start(transfer_id_, file_name_, file_size_);
    ctx_.progress.start_ack(transfer_id_, file_name_, file_size_);

    const auto limit = channel_chunk_limit();
    if (limit < ctx_.planner.min_chunk_size()) {
        co_return fail(error::ErrorKind::Protocol, "Channel message limit too small for any chunk");
    }
    ctx_.planner.update_max_chunk_size(limit);
    for (const auto& channel : targets_) {
        ctx_.pacer.attach(*channel);
    }

    spdlog::info("[FileSender::send_file] Hashing {} ({} bytes)", file_name_, file_size_);
    const auto file_hash = co_await ctx_.executor.offload(
        [path = file_path_]() { return util::hash::sha256_file_hex(path); });
    if (!file_hash) {
        co_return fail(error::ErrorKind::Storage, "Failed to hash " + file_path_.string());
    }
    if (cancelled_) {
        co_return finish_cancelled();
    }

    std::optional<Failure> failure;
    try {
        send_start(*file_hash);
        announced_ = true;
        spdlog::info("[FileSender::send_file] Sending {} to {} peer(s), id {}",
                     file_name_,
                     targets_.size(),
                     transfer_id_);

        std::uint64_t offset = 0;
        while (offset < file_size_ && !failure) {
            if (cancelled_) {
                break;
            }
            if (targets_.empty()) {
                failure = Failure{error::ErrorKind::Network, "All target peers disconnected"};
                break;
            }

            const auto index = chunks_.size();
            if (index > 0 && index % ctx_.settings.replan_interval == 0) {
                ctx_.monitor.update_quality();
                const auto rec = ctx_.planner.update_chunk_size(ctx_.monitor.metrics());
                spdlog::debug("[FileSender::send_file] Chunk size {} ({})",
                              ctx_.planner.current_chunk_size(),
                              rec.reasoning);
            }
            if (index > 0 && index % ctx_.settings.rtt_sample_interval == 0) {
                const auto metrics = ctx_.monitor.metrics();
                if (metrics.rtt_samples > 0) {
                    ctx_.planner.record_performance(metrics.current_rtt_ms, true);
                }
            }

            std::size_t chunk_size = std::min<std::uint64_t>(ctx_.planner.current_chunk_size(),
                                                             file_size_ - offset);
            for (;;) {
                auto data = read_chunk(in, offset, chunk_size);
                if (!data) {
                    failure = Failure{error::ErrorKind::Storage, "Failed to read " + file_name_};
                    break;
                }
                const auto hash = util::hash::sha256_hex(ConstDataBlock(data->data(), data->size()));
                if (!hash) {
                    failure = Failure{error::ErrorKind::Integrity, "Failed to hash chunk"};
                    break;
                }

                const auto remaining = file_size_ - offset;
                wire::ChunkHeader header;
                header.set_chunk_index(index);
                header.set_total_chunks_estimate(index + (remaining + chunk_size - 1) / chunk_size);
                header.set_payload_length(data->size());
                header.set_chunk_hash(*hash);
                header.set_offset(offset);

                const auto frame = protocol::make_data_frame(
                    transfer_id_, header, ConstDataBlock(data->data(), data->size()));
                if (!frame) {
                    failure = Failure{error::ErrorKind::Protocol, "Failed to encode chunk"};
                    break;
                }

                try {
                    send_to_targets(ConstDataBlock(frame->data(), frame->size()));
                } catch (const core::ChannelError& e) {
                    if (e.kind() != core::ChannelError::Kind::MessageTooLarge
                        || !ctx_.planner.reduce_for_oversize()) {
                        throw;
                    }
                    spdlog::warn("[FileSender::send_file] Chunk {} refused ({}), retrying at {} bytes",
                                 index,
                                 e.what(),
                                 ctx_.planner.current_chunk_size());
                    chunk_size = std::min<std::uint64_t>(ctx_.planner.current_chunk_size(),
                                                         file_size_ - offset);
                    continue;
                }

                chunks_.push_back(ChunkInfo{offset,
                                            static_cast<std::uint32_t>(data->size()),
                                            *hash,
                                            std::chrono::steady_clock::now(),
                                            false});
                offset += data->size();
                bytes_sent_ = offset;
                ctx_.monitor.record_chunk_transfer(data->size());
                ctx_.progress.update(transfer_id_, bytes_sent_);
                ctx_.errors.update_metrics(transfer_id_, {.bytes_transferred = bytes_sent_,
                                                          .chunks_transferred = 1});
                break;
            }
            if (failure) {
                break;
            }

            co_await pace_targets();
            if (chunks_.size() % ctx_.settings.yield_interval == 0) {
                co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);
            }
        }

        if (!failure && !cancelled_) {
            const auto targets = targets_;
            for (const auto& channel : targets) {
                if (!co_await ctx_.pacer.drain(*channel, &cancelled_) && !cancelled_) {
                    spdlog::warn("[FileSender::send_file] {} did not drain before END",
                                 channel->peer_id());
                }
            }
        }
        if (!failure && !cancelled_) {
            send_end();
        }
    } catch (const core::ChannelError& e) {
        const auto kind = e.kind() == core::ChannelError::Kind::MessageTooLarge
                              ? error::ErrorKind::Protocol
                              : error::ErrorKind::Network;
        failure = Failure{kind, e.what()};
    } catch (const std::exception& e) {
        failure = Failure{error::ErrorKind::Protocol, e.what()};
    }

    if (failure) {
        spdlog::error("[FileSender::send_file] {} failed: {}", file_name_, failure->message);
        co_return fail(failure->kind, failure->message);
    }

    if (cancelled_) {
        co_return finish_cancelled();
    }

    status_ = SendStatus::Sent;
    ctx_.progress.complete(transfer_id_);
    ctx_.errors.complete_transfer(transfer_id_, error::FinalStatus::Completed);
    spdlog::info("[FileSender::send_file] Sent {} in {} chunks, {} ms",
                 file_name_,
                 chunks_.size(),
                 util::elapsed_ms(started_at_));
    co_return SendResult{transfer_id_, status_, chunks_.size(), bytes_sent_, std::nullopt};
}

asio::awaitable<void> FileSender::resend_chunks(std::vector<std::uint64_t> chunk_indices) {
    if ((status_ != SendStatus::Sent && status_ != SendStatus::Failed) || !announced_ || cancelled_) {
        spdlog::warn("[FileSender::resend_chunks] {} is {}, ignoring resend request",
                     transfer_id_,
                     to_string(status_));
        co_return;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in) {
        fail(error::ErrorKind::Storage, "Cannot reopen " + file_path_.string() + " for resend");
        co_return;
    }

    std::sort(chunk_indices.begin(), chunk_indices.end());
    chunk_indices.erase(std::unique(chunk_indices.begin(), chunk_indices.end()),
                        chunk_indices.end());
    spdlog::info("[FileSender::resend_chunks] Re-sending {} chunk(s) of {}",
                 chunk_indices.size(),
                 file_name_);

    std::optional<Failure> failure;
    try {
        for (const auto index : chunk_indices) {
            if (cancelled_) {
                co_return;
            }
            if (index >= chunks_.size()) {
                spdlog::warn("[FileSender::resend_chunks] Unknown chunk {} of {}", index, transfer_id_);
                continue;
            }

            auto& info = chunks_[index];
            auto data = read_chunk(in, info.offset, info.size);
            if (!data) {
                failure = Failure{error::ErrorKind::Storage, "Failed to re-read " + file_name_};
                break;
            }
            const auto hash = util::hash::sha256_hex(ConstDataBlock(data->data(), data->size()));
            if (!hash || *hash != info.hash) {
                failure = Failure{error::ErrorKind::Integrity,
                                  file_name_ + " changed on disk while transferring"};
                break;
            }

            wire::ChunkHeader header;
            header.set_chunk_index(index);
            header.set_total_chunks_estimate(chunks_.size());
            header.set_payload_length(info.size);
            header.set_chunk_hash(info.hash);
            header.set_offset(info.offset);
            const auto frame = protocol::make_data_frame(
                transfer_id_, header, ConstDataBlock(data->data(), data->size()));
            if (!frame) {
                failure = Failure{error::ErrorKind::Protocol, "Failed to encode chunk"};
                break;
            }
            send_to_targets(ConstDataBlock(frame->data(), frame->size()));
            info.sent_at = std::chrono::steady_clock::now();
            ctx_.errors.update_metrics(transfer_id_, {.chunks_retried = 1});

            co_await pace_targets();
        }

        if (!failure && !cancelled_) {
            const auto targets = targets_;
            for (const auto& channel : targets) {
                co_await ctx_.pacer.drain(*channel, &cancelled_);
            }
            send_end();
        }
    } catch (const std::exception& e) {
        failure = Failure{error::ErrorKind::Network, e.what()};
    }

    if (failure) {
        spdlog::error("[FileSender::resend_chunks] {} failed: {}", file_name_, failure->message);
        fail(failure->kind, failure->message);
        co_return;
    }
    if (!cancelled_ && status_ == SendStatus::Failed) {
        status_ = SendStatus::Sent;
    }
}

void FileSender::on_ack(const wire::FileAck& ack, std::chrono::steady_clock::time_point now) {
    ctx_.progress.on_ack(transfer_id_, static_cast<int>(ack.progress_percent()));

    // The newest chunk fully covered by the acknowledged byte count yields
    // one round-trip sample.
    const auto acked = ack.bytes_received();
    auto it = std::upper_bound(chunks_.begin(), chunks_.end(), acked, [](std::uint64_t bytes, const ChunkInfo& c) {
        return bytes < c.offset + c.size;
    });
    if (it == chunks_.begin()) {
        return;
    }
    --it;
    if (it->rtt_sampled) {
        return;
    }
    it->rtt_sampled = true;

    const auto rtt = std::chrono::duration<double, std::milli>(now - it->sent_at).count();
    if (rtt >= 0.0) {
        ctx_.monitor.update_rtt(rtt);
    }
}

} // namespace sender
