#pragma once

#include "core/channel.h"
#include "core/timer/signal.h"
#include "util/settings.h"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace sender {

enum class PaceResult { Ready, Drained, TimedOut, Cancelled };

const char* to_string(PaceResult result);

// Holds senders back while a channel's outbound buffer is above the
// high-water mark. Waits are woken by the channel's buffered-amount-low
// notification and always end within the configured timeout.
class TransmissionPacer {
  public:
    TransmissionPacer(asio::any_io_executor executor, util::PacingSettings settings);

    TransmissionPacer(const TransmissionPacer&) = delete;
    TransmissionPacer& operator=(const TransmissionPacer&) = delete;

    std::size_t high_water_mark() const;
    std::size_t low_threshold() const;

    // Installs the low threshold and drain handler on the channel. Idempotent.
    void attach(core::Channel& channel);
    // Must be called before a attached channel goes away.
    void detach(const std::string& peer_id);

    asio::awaitable<PaceResult> wait_for_backpressure(core::Channel& channel,
                                                      const std::atomic<bool>* cancelled = nullptr);

    // Polls until nothing is buffered. Returns false on timeout, cancellation
    // or a closed channel.
    asio::awaitable<bool> drain(core::Channel& channel, const std::atomic<bool>* cancelled = nullptr);

    std::size_t timeouts() const { return timeouts_; }

  private:
    struct PeerState {
        core::Channel* channel = nullptr;
        std::unique_ptr<core::timer::Signal> drained;
        int waiters = 0;
    };

    asio::any_io_executor executor_;
    util::PacingSettings settings_;
    std::map<std::string, PeerState> peers_;
    std::size_t timeouts_ = 0;
};

} // namespace sender
