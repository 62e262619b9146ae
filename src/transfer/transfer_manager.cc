#include "transfer/transfer_manager.h"
#include "protocol/codec.h"
#include "protocol/messages.h"
#include "util/uuid.h"
#include <asio/post.hpp>
#include <exception>
#include <spdlog/spdlog.h>

namespace transfer {

TransferManager::TransferManager(core::Executor& executor, util::TransferSettings settings)
    : executor_(executor)
    , settings_(std::move(settings))
    , acks_(settings_.ack)
    , sender_errors_(error::Role::Sender)
    , receiver_errors_(error::Role::Receiver)
    , retries_(settings_.receiver.max_chunk_retries)
    , planner_(settings_.chunking)
    , pacer_(executor.get_io_context().get_executor(), settings_.pacing) {
    if (settings_.persistence.enabled) {
        persistence_ = persistence::PersistenceManager::create(
            executor_, error::Role::Receiver, settings_.persistence);
    }

    receiver::ReceiverContext context{executor_,
                                      persistence_.get(),
                                      progress_,
                                      acks_,
                                      receiver_errors_,
                                      retries_,
                                      settings_.receiver};
    reassembler_ = std::make_unique<receiver::Reassembler>(
        context, [this](const std::string& peer_id, ConstDataBlock frame) { return reply(peer_id, frame); });
}

TransferManager::~TransferManager() {
    for (auto& [peer_id, channel] : peers_) {
        channel->on_message(nullptr);
        pacer_.detach(peer_id);
    }
}

void TransferManager::start() {
    if (!persistence_) {
        return;
    }
    const auto removed = persistence_->cleanup_old_states();
    if (removed > 0) {
        spdlog::info("[TransferManager::start] Removed {} stale transfer record(s)", removed);
    }
    executor_.spawn(persistence_->run_periodic_cleanup());
}

void TransferManager::stop() {
    for (auto& [id, file_sender] : senders_) {
        const auto status = file_sender->status();
        if (status == sender::SendStatus::Pending || status == sender::SendStatus::Sending) {
            file_sender->cancel();
        }
    }
    if (persistence_) {
        persistence_->stop();
        persistence_->flush_all();
    }
}

void TransferManager::add_peer(std::shared_ptr<core::Channel> channel) {
    const auto peer_id = channel->peer_id();
    if (peers_.contains(peer_id)) {
        spdlog::info("[TransferManager::add_peer] Replacing channel to {}", peer_id);
        peers_[peer_id]->on_message(nullptr);
        pacer_.detach(peer_id);
    }

    channel->on_message([this, peer_id](ConstDataBlock message) { handle_message(peer_id, message); });
    pacer_.attach(*channel);
    peers_[peer_id] = channel;

    // Outgoing transfers already aimed at this peer continue on the new channel.
    for (auto& [id, file_sender] : senders_) {
        if (file_sender->targets(peer_id)) {
            file_sender->replace_target(channel);
        }
    }
    spdlog::info("[TransferManager::add_peer] Peer {} connected", peer_id);
}

void TransferManager::remove_peer(const std::string& peer_id) {
    const auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return;
    }

    for (auto& [id, file_sender] : senders_) {
        file_sender->remove_target(peer_id);
    }
    reassembler_->on_peer_lost(peer_id);

    it->second->on_message(nullptr);
    pacer_.detach(peer_id);
    peers_.erase(it);
    spdlog::info("[TransferManager::remove_peer] Peer {} disconnected", peer_id);
}

std::vector<std::string> TransferManager::peers() const {
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& [peer_id, channel] : peers_) {
        ids.push_back(peer_id);
    }
    return ids;
}

sender::SenderContext TransferManager::sender_context() {
    return sender::SenderContext{
        executor_, pacer_, planner_, monitor_, progress_, sender_errors_, settings_.sender};
}

std::optional<std::string> TransferManager::send_file(const std::filesystem::path& file,
                                                      const std::optional<std::string>& target_peer) {
    std::vector<std::shared_ptr<core::Channel>> targets;
    if (target_peer) {
        const auto it = peers_.find(*target_peer);
        if (it == peers_.end() || !it->second->is_open()) {
            spdlog::warn("[TransferManager::send_file] Peer {} is not connected", *target_peer);
            return std::nullopt;
        }
        targets.push_back(it->second);
    } else {
        for (const auto& [peer_id, channel] : peers_) {
            if (channel->is_open()) {
                targets.push_back(channel);
            }
        }
    }
    if (targets.empty()) {
        spdlog::warn("[TransferManager::send_file] No connected peer to send {} to", file.string());
        return std::nullopt;
    }

    const auto transfer_id = util::generate_uuid();
    auto file_sender = std::make_shared<sender::FileSender>(
        sender_context(), std::move(targets), file, transfer_id);
    senders_[transfer_id] = file_sender;

    executor_.spawn(
        [file_sender]() -> asio::awaitable<sender::SendResult> { co_return co_await file_sender->send_file(); },
        [transfer_id](std::exception_ptr e, sender::SendResult result) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    spdlog::error("[TransferManager::send_file] Transfer {} aborted: {}", transfer_id, ex.what());
                }
                return;
            }
            if (result.error) {
                spdlog::error("[TransferManager::send_file] Transfer {} {}: {}",
                              transfer_id,
                              sender::to_string(result.status),
                              result.error->message);
            } else {
                spdlog::info("[TransferManager::send_file] Transfer {} {} ({} bytes, {} chunks)",
                             transfer_id,
                             sender::to_string(result.status),
                             result.bytes_sent,
                             result.total_chunks);
            }
        });
    return transfer_id;
}

bool TransferManager::cancel_transfer(const std::optional<std::string>& transfer_id) {
    if (transfer_id) {
        if (const auto file_sender = find_sender(*transfer_id)) {
            file_sender->cancel();
            return true;
        }
        return reassembler_->cancel(*transfer_id);
    }

    bool any = false;
    for (auto& [id, file_sender] : senders_) {
        const auto status = file_sender->status();
        if (status == sender::SendStatus::Pending || status == sender::SendStatus::Sending) {
            file_sender->cancel();
            any = true;
        }
    }
    for (const auto& snapshot : reassembler_->snapshots()) {
        if (snapshot.phase != receiver::Phase::Complete && snapshot.phase != receiver::Phase::Failed) {
            any = reassembler_->cancel(snapshot.transfer_id) || any;
        }
    }
    return any;
}

void TransferManager::clear_transfer(const std::optional<std::string>& transfer_id) {
    const auto finished = [](const sender::FileSender& s) {
        return s.status() != sender::SendStatus::Pending && s.status() != sender::SendStatus::Sending;
    };

    if (transfer_id) {
        const auto it = senders_.find(*transfer_id);
        if (it != senders_.end()) {
            if (!finished(*it->second)) {
                spdlog::warn("[TransferManager::clear_transfer] {} is still running", *transfer_id);
                return;
            }
            senders_.erase(it);
            sender_errors_.cleanup(*transfer_id);
        } else {
            const auto snapshot = reassembler_->snapshot(*transfer_id);
            if (snapshot && snapshot->phase != receiver::Phase::Complete
                && snapshot->phase != receiver::Phase::Failed) {
                spdlog::warn("[TransferManager::clear_transfer] {} is still running", *transfer_id);
                return;
            }
            receiver_errors_.cleanup(*transfer_id);
            retries_.clear(*transfer_id);
        }
        progress_.clear(*transfer_id);
        return;
    }

    std::erase_if(senders_, [&](const auto& entry) {
        if (!finished(*entry.second)) {
            return false;
        }
        sender_errors_.cleanup(entry.first);
        return true;
    });
    reassembler_->clear_finished();
    progress_.clear_finished();
}

std::optional<progress::TransferProgress>
TransferManager::transfer_progress(const std::optional<std::string>& transfer_id) const {
    return transfer_id ? progress_.progress(*transfer_id) : progress_.current();
}

std::optional<progress::AckProgress>
TransferManager::ack_progress(const std::optional<std::string>& transfer_id) const {
    return transfer_id ? progress_.ack(*transfer_id) : progress_.current_ack();
}

bool TransferManager::resume_transfer(const std::string& transfer_id) {
    if (const auto file_sender = find_sender(transfer_id)) {
        const auto status = file_sender->status();
        if (status != sender::SendStatus::Sent && status != sender::SendStatus::Failed) {
            spdlog::warn("[TransferManager::resume_transfer] {} is {}, nothing to resume",
                         transfer_id,
                         sender::to_string(status));
            return false;
        }
        spawn_resend(file_sender, {});
        return true;
    }

    std::string peer_id;
    if (const auto snapshot = reassembler_->snapshot(transfer_id);
        snapshot && peers_.contains(snapshot->peer_id)) {
        peer_id = snapshot->peer_id;
    } else if (peers_.size() == 1) {
        peer_id = peers_.begin()->first;
    }
    return reassembler_->resume(transfer_id, peer_id);
}

bool TransferManager::can_resume_transfer(const std::string& transfer_id) {
    return persistence_ && persistence_->can_resume_transfer(transfer_id);
}

std::vector<std::uint64_t> TransferManager::missing_chunks(const std::string& transfer_id) {
    if (!persistence_) {
        return {};
    }
    return persistence_->get_missing_chunks(transfer_id);
}

std::vector<error::StructuredError> TransferManager::error_history(const std::string& transfer_id) const {
    auto history = sender_errors_.error_history(transfer_id);
    const auto& incoming = receiver_errors_.error_history(transfer_id);
    history.insert(history.end(), incoming.begin(), incoming.end());
    return history;
}

std::optional<error::TransferMetrics> TransferManager::transfer_metrics(const std::string& transfer_id) const {
    if (auto metrics = sender_errors_.metrics(transfer_id)) {
        return metrics;
    }
    return receiver_errors_.metrics(transfer_id);
}

std::optional<receiver::IncomingSnapshot> TransferManager::incoming(const std::string& transfer_id) const {
    return reassembler_->snapshot(transfer_id);
}

std::optional<sender::SendStatus> TransferManager::outgoing(const std::string& transfer_id) const {
    if (const auto file_sender = find_sender(transfer_id)) {
        return file_sender->status();
    }
    return std::nullopt;
}

void TransferManager::on_file_received(receiver::Reassembler::ReceivedFn callback) {
    reassembler_->on_file_received(std::move(callback));
}

void TransferManager::on_progress(progress::ProgressTracker::Listener listener) {
    if (!listener) {
        progress_.on_progress({});
        return;
    }
    // Posted, so a listener may call back into the manager while the sender
    // or reassembler is still mid-update.
    progress_.on_progress([this, listener = std::move(listener)](const progress::TransferProgress& p) {
        asio::post(executor_.get_io_context(), [listener, p]() { listener(p); });
    });
}

void TransferManager::set_confirmation(receiver::Reassembler::ConfirmFn confirm) {
    reassembler_->set_confirmation(std::move(confirm));
}

std::shared_ptr<sender::FileSender> TransferManager::find_sender(const std::string& transfer_id) const {
    const auto it = senders_.find(transfer_id);
    return it != senders_.end() ? it->second : nullptr;
}

void TransferManager::spawn_resend(std::shared_ptr<sender::FileSender> file_sender,
                                   std::vector<std::uint64_t> indices) {
    executor_.spawn(
        [file_sender, indices = std::move(indices)]() mutable -> asio::awaitable<void> {
            co_await file_sender->resend_chunks(std::move(indices));
        },
        [id = file_sender->transfer_id()](std::exception_ptr e) {
            if (!e) {
                return;
            }
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("[TransferManager::spawn_resend] Resend for {} aborted: {}", id, ex.what());
            }
        });
}

bool TransferManager::reply(const std::string& peer_id, ConstDataBlock frame) {
    const auto it = peers_.find(peer_id);
    if (it == peers_.end() || !it->second->is_open()) {
        spdlog::debug("[TransferManager::reply] Peer {} is gone", peer_id);
        return false;
    }
    try {
        it->second->send(frame);
    } catch (const core::ChannelError& e) {
        spdlog::warn("[TransferManager::reply] Failed to send to {}: {}", peer_id, e.what());
        return false;
    }
    return true;
}

void TransferManager::handle_message(const std::string& peer_id, ConstDataBlock message) {
    using protocol::MessageType;

    const auto frame = protocol::decode(message);
    if (!frame) {
        spdlog::warn("[TransferManager::handle_message] Dropping malformed frame from {}", peer_id);
        return;
    }

    if (frame->is(MessageType::Start) || frame->is(MessageType::Data) || frame->is(MessageType::End)) {
        reassembler_->handle_frame(peer_id, *frame);
    } else if (frame->is(MessageType::Error)) {
        const auto file_sender = find_sender(frame->transfer_id);
        if (!file_sender) {
            reassembler_->handle_frame(peer_id, *frame);
            return;
        }
        const auto err = protocol::parse_body<wire::FileError>(*frame);
        if (!err) {
            spdlog::warn("[TransferManager::handle_message] Malformed ERROR for {}", frame->transfer_id);
            return;
        }
        file_sender->on_remote_error(peer_id, *err);
    } else if (frame->is(MessageType::Ack)) {
        const auto file_sender = find_sender(frame->transfer_id);
        const auto ack = protocol::parse_body<wire::FileAck>(*frame);
        if (!file_sender || !ack) {
            spdlog::debug("[TransferManager::handle_message] Ignoring ACK for {}", frame->transfer_id);
            return;
        }
        file_sender->on_ack(*ack);
    } else if (frame->is(MessageType::Resend)) {
        const auto file_sender = find_sender(frame->transfer_id);
        const auto request = protocol::parse_body<wire::ResendRequest>(*frame);
        if (!file_sender || !request) {
            spdlog::warn("[TransferManager::handle_message] Cannot serve RESEND for {}", frame->transfer_id);
            return;
        }
        if (!file_sender->targets(peer_id)) {
            // The receiver came back after its channel was dropped.
            file_sender->replace_target(peers_.at(peer_id));
        }
        std::vector<std::uint64_t> indices(request->chunk_indices().begin(), request->chunk_indices().end());
        spawn_resend(file_sender, std::move(indices));
    } else {
        spdlog::warn("[TransferManager::handle_message] Unknown message type {} from {}",
                     frame->type,
                     peer_id);
    }
}

} // namespace transfer
