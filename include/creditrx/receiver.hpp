/**
 * @file receiver.hpp
 * @brief Receiver: runs one TransferSession against an IChannel.
 *
 * @details
 * Two activities share the session:
 *  - the channel's frame handler (transport thread) feeds frames;
 *  - run() (calling thread) samples every `sample_interval_ms`.
 *
 * Both enter the session through one mutex. Credit writes happen after the
 * session lock is released and their outcome is reported back under the lock.
 * Events are drained after every call and handed to the sink in order; the
 * sink may be called from either thread but never concurrently.
 *
 * Clock and sleeper are injectable so tests can run a full transfer without
 * waiting on real time.
 */
#ifndef CREDITRX_RECEIVER_HPP
#define CREDITRX_RECEIVER_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <stdint.h>
#include <vector>
#include "creditrx/session.hpp"
#include "creditrx/transport/channel_base.hpp"

namespace creditrx {

class Receiver {
public:
  using EventSink = std::function<void(const Event&)>;
  using Clock     = std::function<uint64_t()>;           ///< Monotonic milliseconds.
  using Sleeper   = std::function<void(uint32_t ms)>;

  /// steady_clock in milliseconds.
  static uint64_t steady_now_ms();
  /// std::this_thread::sleep_for.
  static void sleep_ms(uint32_t ms);

  Receiver(transport::IChannel& channel,
           const SessionConfig& cfg = SessionConfig{},
           EventSink sink = nullptr,
           Clock now = &Receiver::steady_now_ms,
           Sleeper sleep = &Receiver::sleep_ms);

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  /**
   * @brief Run one transfer to a terminal state.
   *
   * Subscribes, writes the initial grant, then samples until the session
   * finishes, @p stop turns true (Aborted "interrupted"), or the channel drops
   * (Aborted "disconnected"). A refused subscription ends as Aborted
   * "subscribe failed", a declared size of 0 as Aborted "no file data". The
   * session starts only once the subscription is in place. The subscription is
   * released exactly once on every path, exceptions from the sink included.
   *
   * @param total_bytes Declared size from the file-info record.
   * @param stop        External cancellation flag, polled once per sample.
   */
  Summary run(uint64_t total_bytes, const std::atomic<bool>& stop);

  TransferProgress progress() const;

  /// Move the assembled bytes out. Call after run() returned.
  std::vector<uint8_t> take_data();

private:
  void handle_frame(const uint8_t* data, size_t len);
  void write_grant(uint8_t credits);
  void drain_events();
  void abort(const char* reason);

  transport::IChannel& channel_;
  TransferSession      session_;
  EventSink            sink_;
  Clock                now_;
  Sleeper              sleep_;

  mutable std::mutex session_mtx_;
  std::mutex         sink_mtx_;     // taken before session_mtx_, never after
};

} // namespace creditrx

#endif // CREDITRX_RECEIVER_HPP
