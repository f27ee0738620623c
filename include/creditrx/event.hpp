/**
 * @file event.hpp
 * @brief Typed events a TransferSession surfaces through its outbox.
 *
 * @details
 * The session never prints. Everything a user or log might want to know is
 * queued as an `Event` and drained by the wrapper with
 * `TransferSession::get_event()`. The wrapper decides how to render it (the CLI
 * prints a line, tests assert on it).
 *
 * Field use per kind:
 *
 * | kind                   | seq               | seq_to             | count         | bytes / total        |
 * |------------------------|-------------------|--------------------|---------------|----------------------|
 * | Progress               | expected_seq      |                    | buffered      | received / declared  |
 * | FrameMalformed         |                   |                    | frame length  |                      |
 * | ChecksumMismatch       | packet seq        | computed crc       | header crc    |                      |
 * | BufferOverflowEviction | evicted seq       |                    | buffered left |                      |
 * | GapSkipped             | old expected_seq  | new expected_seq   | seqs lost     |                      |
 * | EndMarker              | last sender seq   |                    |               | received / declared  |
 * | Stalled                | expected_seq      | min buffered seq   | buffered      | received / declared  |
 * | AcceptedIncomplete     |                   |                    |               | received / declared  |
 * | TimedOut               |                   |                    |               | received / declared  |
 * | TransportWriteFailed   |                   |                    | credits lost  |                      |
 * | Finished               |                   |                    | packets       | received / declared  |
 *
 * `frame_status` is set for FrameMalformed; `reason` for Finished after an abort.
 */
#ifndef CREDITRX_EVENT_HPP
#define CREDITRX_EVENT_HPP

#include <stdint.h>
#include "etl/string.h"
#include "creditrx/packet_codec.hpp"

namespace creditrx {

enum class EventKind : uint8_t {
  Progress               = 0,
  FrameMalformed         = 1,
  ChecksumMismatch       = 2,
  BufferOverflowEviction = 3,
  GapSkipped             = 4,
  EndMarker              = 5,
  Stalled                = 6,
  AcceptedIncomplete     = 7,
  TimedOut               = 8,
  TransportWriteFailed   = 9,
  Finished               = 10
};

/// Lower-case, dash-separated name ("gap-skipped", ...). Stable; scripts grep it.
const char* to_string(EventKind k);

/// Short free-text reason (abort causes).
using ReasonStr = etl::string<32>;

struct Event {
  EventKind   kind{EventKind::Progress};
  uint64_t    at_ms{0};            ///< Session-relative timestamp.
  uint32_t    seq{0};
  uint32_t    seq_to{0};
  uint64_t    count{0};
  uint64_t    bytes{0};
  uint64_t    total{0};
  uint32_t    throughput_bps{0};   ///< Bytes per second since start (Progress/Finished).
  FrameStatus frame_status{FrameStatus::Ok};
  ReasonStr   reason;
};

} // namespace creditrx

#endif // CREDITRX_EVENT_HPP
