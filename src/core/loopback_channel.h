#pragma once

#include "core/channel.h"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace core {

struct LoopbackOptions {
    std::size_t max_message_size = 256 * 1024;
    // send() throws BufferFull when a message would push the outbound
    // buffer past this ceiling.
    std::size_t buffer_capacity = 16 * 1024 * 1024;
    // Bytes moved to the peer per tick; at least one message per tick.
    std::size_t bytes_per_tick = 256 * 1024;
    std::chrono::microseconds tick{1000};
};

// In-process channel pair. Each end buffers outbound messages and drains them
// to the other end on a timer, so buffered_amount() behaves like a real
// transport's send buffer.
class LoopbackChannel : public Channel, public std::enable_shared_from_this<LoopbackChannel> {
  public:
    using Pair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

    // first is held by peer a_id and talks to b_id, second the reverse.
    static Pair make_pair(asio::io_context& io_context,
                          const std::string& a_id,
                          const std::string& b_id,
                          const LoopbackOptions& options = {});

    LoopbackChannel(asio::io_context& io_context, std::string peer_id, LoopbackOptions options);

    LoopbackChannel(const LoopbackChannel&) = delete;
    LoopbackChannel& operator=(const LoopbackChannel&) = delete;

    const std::string& peer_id() const override { return peer_id_; }
    bool is_open() const override { return open_; }
    void send(ConstDataBlock message) override;
    std::size_t buffered_amount() const override { return buffered_; }
    std::size_t max_message_size() const override { return options_.max_message_size; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override {
        low_threshold_ = threshold;
    }
    std::size_t buffered_amount_low_threshold() const override { return low_threshold_; }
    void on_buffered_amount_low(DrainHandler handler) override { drain_handler_ = std::move(handler); }
    void on_message(MessageHandler handler) override { message_handler_ = std::move(handler); }

    // Closes both ends and drops anything still buffered.
    void close();

    std::size_t peak_buffered_amount() const { return peak_buffered_; }
    std::size_t messages_sent() const { return messages_sent_; }

  private:
    asio::awaitable<void> pump();
    void deliver(ConstDataBlock message);
    void close_local();

    asio::io_context& io_context_;
    std::string peer_id_;
    LoopbackOptions options_;
    std::weak_ptr<LoopbackChannel> remote_;

    std::deque<std::vector<std::byte>> outbound_;
    std::size_t buffered_ = 0;
    std::size_t peak_buffered_ = 0;
    std::size_t low_threshold_ = 0;
    std::size_t messages_sent_ = 0;
    bool open_ = true;
    bool pumping_ = false;

    DrainHandler drain_handler_;
    MessageHandler message_handler_;
};
} // namespace core
