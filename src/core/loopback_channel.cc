#include "loopback_channel.h"
#include "core/timer/spawn_after_delay.h"
#include <algorithm>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <spdlog/spdlog.h>

namespace core {

LoopbackChannel::Pair LoopbackChannel::make_pair(asio::io_context& io_context,
                                                 const std::string& a_id,
                                                 const std::string& b_id,
                                                 const LoopbackOptions& options) {
    auto a_side = std::make_shared<LoopbackChannel>(io_context, b_id, options);
    auto b_side = std::make_shared<LoopbackChannel>(io_context, a_id, options);
    a_side->remote_ = b_side;
    b_side->remote_ = a_side;
    return {a_side, b_side};
}

LoopbackChannel::LoopbackChannel(asio::io_context& io_context,
                                 std::string peer_id,
                                 LoopbackOptions options)
    : io_context_(io_context)
    , peer_id_(std::move(peer_id))
    , options_(options) {}

void LoopbackChannel::send(ConstDataBlock message) {
    if (!open_) {
        throw ChannelError(ChannelError::Kind::Closed, "channel to " + peer_id_ + " is closed");
    }
    if (message.size() > options_.max_message_size) {
        throw ChannelError(ChannelError::Kind::MessageTooLarge,
                           "message of " + std::to_string(message.size())
                               + " bytes exceeds limit "
                               + std::to_string(options_.max_message_size));
    }
    if (buffered_ + message.size() > options_.buffer_capacity) {
        throw ChannelError(ChannelError::Kind::BufferFull,
                           "send buffer to " + peer_id_ + " is full");
    }

    outbound_.emplace_back(message.begin(), message.end());
    buffered_ += message.size();
    peak_buffered_ = std::max(peak_buffered_, buffered_);
    ++messages_sent_;

    if (!pumping_) {
        pumping_ = true;
        asio::co_spawn(io_context_, [self = shared_from_this()]() { return self->pump(); },
                       asio::detached);
    }
}

asio::awaitable<void> LoopbackChannel::pump() {
    while (open_ && !outbound_.empty()) {
        if (!co_await timer::sleep_for(options_.tick)) {
            break;
        }

        std::size_t moved = 0;
        while (open_ && !outbound_.empty()
               && (moved == 0 || moved + outbound_.front().size() <= options_.bytes_per_tick)) {
            auto message = std::move(outbound_.front());
            outbound_.pop_front();

            const bool was_above = buffered_ > low_threshold_;
            buffered_ -= message.size();
            moved += message.size();

            if (auto remote = remote_.lock()) {
                remote->deliver(ConstDataBlock(message.data(), message.size()));
            }

            if (was_above && buffered_ <= low_threshold_ && drain_handler_) {
                drain_handler_();
            }
        }
    }
    pumping_ = false;
}

void LoopbackChannel::deliver(ConstDataBlock message) {
    if (!open_) {
        return;
    }
    if (!message_handler_) {
        spdlog::warn("[LoopbackChannel::deliver] No handler on channel to {}, dropping {} bytes",
                     peer_id_,
                     message.size());
        return;
    }
    message_handler_(message);
}

void LoopbackChannel::close() {
    close_local();
    if (auto remote = remote_.lock()) {
        remote->close_local();
    }
}

void LoopbackChannel::close_local() {
    if (!open_) {
        return;
    }
    open_ = false;
    outbound_.clear();
    buffered_ = 0;
    spdlog::debug("[LoopbackChannel::close_local] Channel to {} closed", peer_id_);
}
} // namespace core
