#include "sender/pacer.h"
#include "core/timer/spawn_after_delay.h"
#include "core/timer/spawn_with_timeout.h"
#include <spdlog/spdlog.h>

namespace sender {

const char* to_string(PaceResult result) {
    switch (result) {
    case PaceResult::Ready:
        return "ready";
    case PaceResult::Drained:
        return "drained";
    case PaceResult::TimedOut:
        return "timed out";
    case PaceResult::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

TransmissionPacer::TransmissionPacer(asio::any_io_executor executor, util::PacingSettings settings)
    : executor_(std::move(executor))
    , settings_(settings) {}

std::size_t TransmissionPacer::high_water_mark() const {
    return settings_.constrained_peer ? settings_.constrained_high_water_mark
                                      : settings_.high_water_mark;
}

std::size_t TransmissionPacer::low_threshold() const {
    return settings_.constrained_peer ? settings_.constrained_low_threshold
                                      : settings_.low_threshold;
}

void TransmissionPacer::attach(core::Channel& channel) {
    auto& peer = peers_[channel.peer_id()];
    if (peer.channel == &channel) {
        return;
    }
    peer.channel = &channel;
    if (!peer.drained) {
        peer.drained = std::make_unique<core::timer::Signal>(executor_);
    }

    channel.set_buffered_amount_low_threshold(low_threshold());
    channel.on_buffered_amount_low([this, id = channel.peer_id()]() {
        const auto it = peers_.find(id);
        if (it != peers_.end() && it->second.drained) {
            it->second.drained->notify();
        }
    });
}

void TransmissionPacer::detach(const std::string& peer_id) {
    const auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return;
    }
    if (it->second.channel != nullptr) {
        it->second.channel->on_buffered_amount_low({});
    }
    if (it->second.drained) {
        it->second.drained->notify();
    }
    peers_.erase(it);
}

asio::awaitable<PaceResult> TransmissionPacer::wait_for_backpressure(
    core::Channel& channel,
    const std::atomic<bool>* cancelled) {
    if (cancelled != nullptr && cancelled->load()) {
        co_return PaceResult::Cancelled;
    }
    if (!channel.is_open() || channel.buffered_amount() < high_water_mark()) {
        co_return PaceResult::Ready;
    }

    attach(channel);
    auto& peer = peers_[channel.peer_id()];
    // A second waiter for the same peer shares the pending wait.
    if (peer.waiters++ == 0) {
        peer.drained->reset();
    }

    const auto buffered = channel.buffered_amount();
    const auto timeout = std::chrono::milliseconds(settings_.wait_timeout_ms);
    const bool woke = co_await core::timer::spawn_with_timeout(peer.drained->wait(), timeout);

    const auto it = peers_.find(channel.peer_id());
    if (it != peers_.end()) {
        --it->second.waiters;
    }

    if (!woke) {
        ++timeouts_;
        spdlog::warn("[TransmissionPacer::wait_for_backpressure] No drain from {} within {} ms "
                     "({} bytes buffered), continuing",
                     channel.peer_id(),
                     settings_.wait_timeout_ms,
                     buffered);
        co_return PaceResult::TimedOut;
    }
    co_return PaceResult::Drained;
}

asio::awaitable<bool> TransmissionPacer::drain(core::Channel& channel,
                                               const std::atomic<bool>* cancelled) {
    const auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::milliseconds(settings_.drain_timeout_ms);
    const auto poll = std::chrono::milliseconds(settings_.drain_poll_ms);

    while (channel.is_open() && channel.buffered_amount() > 0) {
        if (cancelled != nullptr && cancelled->load()) {
            co_return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("[TransmissionPacer::drain] {} still holds {} bytes after {} ms",
                         channel.peer_id(),
                         channel.buffered_amount(),
                         settings_.drain_timeout_ms);
            co_return false;
        }
        co_await core::timer::sleep_for(poll);
    }
    co_return channel.is_open();
}

} // namespace sender
