/**
 * @file session.hpp
 * @brief TransferSession: the state machine that turns notification frames into one file.
 *
 * @details
 * ## Field Brief
 * The peripheral streams a file as small notifications. The link drops some,
 * repeats some, and shuffles the rest. There is no retransmission. The session
 * gets as close to the original bytes as the link allows, keeps the sender
 * paced with credits, and says plainly what it could not recover.
 *
 * It owns exactly three things for one transfer: a `ReorderBuffer`, a
 * `FlowController`, and the output byte vector. It does not own a transport,
 * a thread or a clock. Wrappers feed it frames and time; it hands back credit
 * grants and events.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [transport callback]                 [TransferSession]                [driving loop]
 *         │                                    │                                │
 *         │                      start(total, now) ──► Subscribed ◄───── wrapper │
 *         │                                    │   (returns initial grant)       │
 *  frame ─┴─ on_frame(bytes, now) ──► codec ─► reorder ─► flow                   │
 *                       ▲                      │       (returns grant or 0)      │
 *                       │                      │                                 │
 *                       │                sample(now) ◄── every 500 ms ───────────┘
 *                       │                      ├─ complete / all bytes  -> Complete
 *                       │                      ├─ 20 flat samples       -> Stalled
 *                       │                      │     ≥ 99 %  -> AcceptedIncomplete
 *                       │                      │     else    -> +32 credits, small-gap skip
 *                       │                      └─ 60 s without a byte   -> TimedOut
 *                       │
 *                get_event() ──► Progress / warnings / Finished
 * ```
 *
 * ---
 *
 * @par States
 * `Idle → Subscribed → Downloading ⇄ Stalled → {Complete, AcceptedIncomplete, TimedOut, Aborted}`
 *
 * - `Stalled` is transient: a sample enters it and leaves it (to Downloading or
 *   AcceptedIncomplete) in the same call.
 * - Terminal states ignore further frames and samples. Each run produces exactly
 *   one `Finished` event.
 *
 * ---
 *
 * @par Recovery
 * - **Large gap** (frame path): a newly buffered packet more than `large_gap`
 *   ahead of expected_seq means the hole will not fill. The session skips to the
 *   lowest buffered sequence and drains.
 * - **Stall** (sample path): after the extra credit grant, a buffered minimum
 *   within `stall_skip_max` of expected_seq is skipped to.
 * Both report `GapSkipped` with the number of sequence numbers given up.
 *
 * ---
 *
 * @par Failure Model
 * - Malformed frame: dropped, `FrameMalformed`, nothing else changes.
 * - CRC mismatch: payload kept, `ChecksumMismatch`.
 * - Buffer overflow: lowest entries evicted, one `BufferOverflowEviction` each.
 * - Credit write failed (reported by the wrapper): `TransportWriteFailed`.
 * - No bytes within `no_data_timeout_ms`: `TimedOut` (fatal).
 * - Wrapper abort (interrupt, disconnect, subscribe failure): `Aborted` (fatal).
 *
 * @par Threading
 * Not thread-safe. The wrapper that runs the transport callback and
 * the sampling loop on different threads serializes them with one mutex (see
 * receiver.hpp). Inside, every call is bounded and non-blocking.
 *
 * @par Minimal usage
 * @code
 * creditrx::TransferSession s;
 * uint8_t grant = s.start(info.size, now_ms());
 * write_credits(grant);
 * // from the transport callback:
 * if (uint8_t g = s.on_frame(buf, len, now_ms())) write_credits(g);
 * // every 500 ms:
 * if (uint8_t g = s.sample(now_ms())) write_credits(g);
 * creditrx::Event e;
 * while (s.get_event(e)) { ... }
 * @endcode
 */
#ifndef CREDITRX_SESSION_HPP
#define CREDITRX_SESSION_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "etl/deque.h"
#include "creditrx/event.hpp"
#include "creditrx/flow_controller.hpp"
#include "creditrx/packet_codec.hpp"
#include "creditrx/reorder_buffer.hpp"
#include "creditrx/session_config.hpp"

namespace creditrx {

enum class SessionState : uint8_t {
  Idle               = 0,
  Subscribed         = 1,
  Downloading        = 2,
  Stalled            = 3,
  Complete           = 4,
  AcceptedIncomplete = 5,
  TimedOut           = 6,
  Aborted            = 7
};

const char* to_string(SessionState s);

/// True for Complete, AcceptedIncomplete, TimedOut and Aborted.
bool is_terminal(SessionState s);

/// Snapshot of transfer progress.
struct TransferProgress {
  uint32_t expected_seq{0};
  uint64_t bytes_received{0};
  uint64_t total_bytes{0};
  uint64_t packets_seen{0};     ///< Valid data packets, duplicates and stale ones included.
  size_t   buffered_count{0};
  bool     complete{false};     ///< End marker seen.
};

/// Final record of one transfer. Counters are authoritative even if events were dropped.
struct Summary {
  SessionState state{SessionState::Idle};
  ReasonStr    reason;                 ///< Abort cause; empty otherwise.
  uint64_t     bytes_received{0};
  uint64_t     total_bytes{0};
  uint64_t     packets_seen{0};
  size_t       buffered_remaining{0};
  uint64_t     elapsed_ms{0};
  uint32_t     throughput_bps{0};
  uint64_t     credits_issued{0};
  uint32_t     credit_writes_failed{0};
  uint32_t     checksum_mismatches{0};
  uint32_t     malformed_frames{0};
  uint32_t     evicted_packets{0};
  uint64_t     skipped_sequences{0};   ///< Sequence numbers given up by gap-skip recovery.
  uint32_t     stall_recoveries{0};
  uint32_t     events_dropped{0};
  bool         end_marker_seen{false};
  uint32_t     end_marker_seq{0};

  /// True when the transfer produced a file worth saving.
  bool succeeded() const {
    return state == SessionState::Complete || state == SessionState::AcceptedIncomplete;
  }

  /// True when any data-loss or integrity warning was recorded.
  bool has_warnings() const {
    return buffered_remaining || checksum_mismatches || evicted_packets ||
           skipped_sequences || credit_writes_failed || malformed_frames;
  }
};

class TransferSession {
public:
  /// Outbox capacity; one frame can produce at most ~70 events, wrappers drain after each call.
  static constexpr size_t EVENT_CAP = 192;

  explicit TransferSession(const SessionConfig& cfg = SessionConfig{});

  /**
   * @brief Begin a transfer.
   *
   * Resets every component, records the start time and enters Subscribed. Call
   * right after the notification subscription succeeded.
   *
   * A declared size of 0 is refused: the session ends Aborted with reason
   * "no file data" and no credits are granted.
   *
   * @param total_bytes Declared file size.
   * @param now_ms      Monotonic milliseconds.
   * @return Initial credit grant for the wrapper to write, 0 when refused.
   */
  uint8_t start(uint64_t total_bytes, uint64_t now_ms);

  /**
   * @brief Consume one raw notification frame.
   *
   * Ignored (returns 0) before start() and after a terminal state.
   *
   * @return Credits to grant now, or 0.
   */
  uint8_t on_frame(const uint8_t* frame, size_t len, uint64_t now_ms);

  /**
   * @brief Driving-loop sample; call every `sample_interval_ms`.
   *
   * Applies completion, stall and timeout rules in that order.
   *
   * @return Credits to grant now (stall top-up), or 0.
   */
  uint8_t sample(uint64_t now_ms);

  /// Report the fate of a credit write the wrapper performed.
  void on_grant_written(uint8_t credits, bool ok, uint64_t now_ms);

  /// Terminate with Aborted. No-op once terminal.
  void abort(const char* reason, uint64_t now_ms);

  /**
   * @brief Pop the oldest queued event.
   * @retval true  @p out holds an event.
   * @retval false Outbox empty.
   */
  bool get_event(Event& out);

  SessionState state() const   { return state_; }
  bool finished() const        { return is_terminal(state_); }
  TransferProgress progress() const;
  Summary summary() const;

  /// Bytes assembled so far, in order.
  const std::vector<uint8_t>& data() const { return output_; }

  /// Move the assembled bytes out (leaves the session's copy empty).
  std::vector<uint8_t> take_data();

  const SessionConfig& config() const { return cfg_; }

private:
  void enter_downloading();
  void handle_data(const Packet& p, uint64_t now_ms);
  void recover_large_gap(uint64_t now_ms);
  void recover_stall(uint64_t now_ms);
  void report_skip(const ReorderBuffer::SkipResult& r, uint64_t now_ms);
  void maybe_progress(uint64_t now_ms);
  void finish(SessionState terminal, uint64_t now_ms);

  void push_event(const Event& e);
  Event make_event(EventKind k, uint64_t now_ms) const;
  uint32_t throughput(uint64_t now_ms) const;
  bool near_complete() const;

  SessionConfig cfg_;
  ReorderBuffer reorder_;
  FlowController flow_;
  std::vector<uint8_t> output_;

  SessionState state_{SessionState::Idle};
  uint64_t total_bytes_{0};
  uint64_t packets_seen_{0};
  bool     complete_{false};
  uint32_t end_seq_{0};

  uint64_t start_ms_{0};
  uint64_t finish_ms_{0};
  uint64_t last_progress_ms_{0};
  bool     progress_sent_{false};

  uint64_t last_sampled_bytes_{0};
  uint16_t flat_samples_{0};

  uint32_t checksum_mismatches_{0};
  uint32_t malformed_frames_{0};
  uint32_t evicted_packets_{0};
  uint64_t skipped_sequences_{0};
  uint32_t stall_recoveries_{0};
  uint32_t events_dropped_{0};
  ReasonStr reason_;

  etl::deque<Event, EVENT_CAP> outbox_;
};

} // namespace creditrx

#endif // CREDITRX_SESSION_HPP
