#pragma once
/**
 * @file channel_base.hpp
 * @brief Minimal notification-channel interface the receiver runs on, plus an RAII subscription.
 *
 * Header-only. Concrete channels (serial bridge, test fakes) implement IChannel.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace creditrx::transport {

// Return codes kept simple; a channel never throws across this boundary.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

/// Called once per inbound notification frame. Never invoked concurrently with itself.
using FrameHandler = std::function<void(const uint8_t* data, std::size_t len)>;

/**
 * @brief What the transfer core needs from the link to the peripheral.
 *
 * Contract:
 *  - subscribe(h) starts notification delivery to h; false if the peripheral refused.
 *  - unsubscribe() stops delivery; safe to call when not subscribed.
 *  - write_credits(n) is a one-byte write without response. It must not block
 *    for long: return Busy rather than wait.
 *  - read_file_info(out) performs the one-time metadata read.
 *  - connected() turns false once the peripheral link is gone.
 *  - name() is a short identifier for logs.
 */
class IChannel {
public:
  virtual ~IChannel() = default;
  virtual bool        subscribe(FrameHandler handler) = 0;
  virtual void        unsubscribe() = 0;
  virtual TxResult    write_credits(uint8_t credits) = 0;
  virtual bool        read_file_info(std::vector<uint8_t>& out) = 0;
  virtual bool        connected() const = 0;
  virtual const char* name() const = 0;
};

/**
 * @brief Scoped notification subscription.
 *
 * Subscribes on construction, unsubscribes exactly once: on release() or on
 * destruction, whichever comes first. Every exit path of a transfer, an
 * exception included, leaves the peripheral unsubscribed.
 */
class Subscription {
public:
  Subscription(IChannel& channel, FrameHandler handler)
  : channel_(&channel) {
    active_ = channel_->subscribe(std::move(handler));
  }

  ~Subscription() { release(); }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  bool active() const { return active_; }

  void release() {
    if (!active_) return;
    active_ = false;
    channel_->unsubscribe();
  }

private:
  IChannel* channel_;
  bool      active_{false};
};

} // namespace creditrx::transport
