#pragma once

#include "util/data_block.h"
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

namespace core {

class ChannelError : public std::runtime_error {
  public:
    enum class Kind { Closed, MessageTooLarge, BufferFull };

    ChannelError(Kind kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind) {}

    Kind kind() const { return kind_; }

  private:
    Kind kind_;
};

// An established, ordered, message-oriented link to one peer. Implementations
// invoke handlers on the executor the transfer stack runs on.
class Channel {
  public:
    using MessageHandler = std::function<void(ConstDataBlock)>;
    using DrainHandler = std::function<void()>;

    virtual ~Channel() = default;

    virtual const std::string& peer_id() const = 0;
    virtual bool is_open() const = 0;

    // Queues one message. Throws ChannelError when the channel is closed or
    // refuses the message.
    virtual void send(ConstDataBlock message) = 0;

    virtual std::size_t buffered_amount() const = 0;
    virtual std::size_t max_message_size() const = 0;

    virtual void set_buffered_amount_low_threshold(std::size_t threshold) = 0;
    virtual std::size_t buffered_amount_low_threshold() const = 0;

    // Fired when buffered_amount() falls to or below the low threshold.
    virtual void on_buffered_amount_low(DrainHandler handler) = 0;
    virtual void on_message(MessageHandler handler) = 0;
};
} // namespace core
