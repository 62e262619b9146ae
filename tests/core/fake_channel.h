#pragma once

#include "core/channel.h"
#include <string>
#include <vector>

namespace test_utils {

// Channel whose buffer level is set by the test and never drains by itself.
class StuckChannel : public core::Channel {
  public:
    explicit StuckChannel(std::string peer_id, std::size_t buffered = 0)
        : peer_id_(std::move(peer_id))
        , buffered_(buffered) {}

    const std::string& peer_id() const override { return peer_id_; }
    bool is_open() const override { return open_; }
    void send(ConstDataBlock message) override {
        if (!open_) {
            throw core::ChannelError(core::ChannelError::Kind::Closed, "closed");
        }
        if (message.size() > max_message_size_) {
            throw core::ChannelError(core::ChannelError::Kind::MessageTooLarge, "too large");
        }
        sent.emplace_back(message.begin(), message.end());
        if (shrink_after_ != 0 && sent.size() == shrink_after_) {
            max_message_size_ = shrink_to_;
        }
    }
    std::size_t buffered_amount() const override { return buffered_; }
    std::size_t max_message_size() const override { return max_message_size_; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }
    std::size_t buffered_amount_low_threshold() const override { return low_threshold_; }
    void on_buffered_amount_low(DrainHandler handler) override { drain_handler_ = std::move(handler); }
    void on_message(MessageHandler handler) override { message_handler_ = std::move(handler); }

    void set_buffered(std::size_t buffered) { buffered_ = buffered; }
    void set_open(bool open) { open_ = open; }
    void set_max_message_size(std::size_t size) { max_message_size_ = size; }
    // Lowers the message limit once `sends` messages went through.
    void shrink_after(std::size_t sends, std::size_t size) {
        shrink_after_ = sends;
        shrink_to_ = size;
    }
    // Drops the level to zero and fires the drain handler.
    void release() {
        buffered_ = 0;
        if (drain_handler_) {
            drain_handler_();
        }
    }
    bool has_drain_handler() const { return static_cast<bool>(drain_handler_); }

    std::vector<ByteBuffer> sent;

  private:
    std::string peer_id_;
    std::size_t buffered_;
    std::size_t low_threshold_ = 0;
    std::size_t max_message_size_ = 256 * 1024;
    std::size_t shrink_after_ = 0;
    std::size_t shrink_to_ = 0;
    bool open_ = true;
    DrainHandler drain_handler_;
    MessageHandler message_handler_;
};

} // namespace test_utils
